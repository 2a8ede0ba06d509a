#ifndef PIXEL_BUFFER_HPP
#define PIXEL_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sonicpx {

    // Row-major RGBA, 4 bytes per pixel
    struct PixelBuffer {
        int width = 0;
        int height = 0;
        std::vector<uint8_t> rgba;

        PixelBuffer() = default;
        PixelBuffer(int w, int h)
            : width(w), height(h),
              rgba(static_cast<size_t>(w) * static_cast<size_t>(h) * 4, 0) {}

        size_t pixelCount() const { return static_cast<size_t>(width) * static_cast<size_t>(height); }
        bool empty() const { return rgba.empty(); }

        uint8_t* pixel(size_t index) { return rgba.data() + index * 4; }
        const uint8_t* pixel(size_t index) const { return rgba.data() + index * 4; }
    };

    void forceOpaque(PixelBuffer& buf);

}

#endif // PIXEL_BUFFER_HPP
