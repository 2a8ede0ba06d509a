#ifndef NOISE_CODEC_HPP
#define NOISE_CODEC_HPP

#include <cstdint>
#include <vector>

#include "pixel_buffer.hpp"

namespace sonicpx {

    // Smallest near-square image holding ceil(len/3) pixels, 3 bytes per pixel
    // in raster order, zero padded, alpha 255. No pixel-level header.
    PixelBuffer encodeNoisePixels(const std::vector<uint8_t>& framed);

    // True when pixel0.RGB + pixel1.R spell SNIC or SNIZ
    bool looksLikeNoiseImage(const PixelBuffer& pixels);

    // R,G,B of every pixel in raster order; the payload parser clamps the tail
    std::vector<uint8_t> extractNoiseBytes(const PixelBuffer& pixels);

}

#endif // NOISE_CODEC_HPP
