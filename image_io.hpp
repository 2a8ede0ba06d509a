#ifndef IMAGE_IO_HPP
#define IMAGE_IO_HPP

#include <opencv2/opencv.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include "pixel_buffer.hpp"

namespace sonicpx {

    // Any format OpenCV reads -> 8-bit RGBA, alpha forced to 255.
    // Tries an unchanged decode first (no orientation or colour conversion)
    // and falls back to the default colour decode.
    PixelBuffer decodeImageBytes(const std::vector<uint8_t>& bytes);

    // Lossless PNG; pixel values come back exactly through decodeImageBytes
    std::vector<uint8_t> encodeImageBytes(const PixelBuffer& pixels);

    // Bicubic when smooth, nearest neighbour otherwise
    PixelBuffer resampleCover(const PixelBuffer& cover, int newWidth, int newHeight, bool smooth);

    // 3-channel BGR view copy, the layout cv:: algorithms expect
    cv::Mat toBgrMat(const PixelBuffer& pixels);

    std::vector<uint8_t> readFileBytes(const std::string& path);
    void writeFileBytes(const std::string& path, const std::vector<uint8_t>& bytes);

    PixelBuffer loadImageFile(const std::string& path);
    void saveImageFile(const std::string& path, const PixelBuffer& pixels);

}

#endif // IMAGE_IO_HPP
