#include "noise_codec.hpp"

#include "codec_error.hpp"
#include "payload.hpp"

#include <cmath>

namespace sonicpx {

    PixelBuffer encodeNoisePixels(const std::vector<uint8_t>& framed)
    {
        if (framed.empty()) {
            throw CodecError(ErrorKind::InvalidArgument, "noise encode: empty buffer");
        }
        const size_t totalPixels = (framed.size() + 2) / 3;
        const size_t width = static_cast<size_t>(std::ceil(std::sqrt(static_cast<double>(totalPixels))));
        const size_t height = (totalPixels + width - 1) / width;

        PixelBuffer img(static_cast<int>(width), static_cast<int>(height));

        size_t bufferIdx = 0;
        for (size_t i = 0; i < img.pixelCount(); ++i) {
            uint8_t* px = img.pixel(i);
            for (int c = 0; c < 3; ++c) {
                px[c] = bufferIdx < framed.size() ? framed[bufferIdx++] : 0;
            }
            px[3] = 255;
        }
        return img;
    }

    bool looksLikeNoiseImage(const PixelBuffer& pixels)
    {
        if (pixels.pixelCount() < 2) {
            return false;
        }
        const uint8_t probe[4] = {
            pixels.pixel(0)[0], pixels.pixel(0)[1], pixels.pixel(0)[2], pixels.pixel(1)[0]
        };
        return hasPayloadMagic(probe);
    }

    std::vector<uint8_t> extractNoiseBytes(const PixelBuffer& pixels)
    {
        std::vector<uint8_t> out;
        out.reserve(pixels.pixelCount() * 3);
        for (size_t i = 0; i < pixels.pixelCount(); ++i) {
            const uint8_t* px = pixels.pixel(i);
            out.push_back(px[0]);
            out.push_back(px[1]);
            out.push_back(px[2]);
        }
        return out;
    }

}
