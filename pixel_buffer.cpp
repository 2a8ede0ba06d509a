#include "pixel_buffer.hpp"

namespace sonicpx {

    void forceOpaque(PixelBuffer& buf)
    {
        for (size_t i = 3; i < buf.rgba.size(); i += 4) {
            buf.rgba[i] = 255;
        }
    }

}
