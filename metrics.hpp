#ifndef METRICS_HPP
#define METRICS_HPP

#include <cstdint>
#include <vector>

#include "pixel_buffer.hpp"

namespace sonicpx {
namespace metrics {

    // R,G,B only; 100 for identical images
    double computePSNR(const PixelBuffer& a, const PixelBuffer& b);

    // Mean of per-channel SSIM (11x11 Gaussian, sigma 1.5)
    double computeSSIM(const PixelBuffer& a, const PixelBuffer& b);

    // Bit error rate of recovered vs. original payload; 1.0 on size mismatch
    double computeBER(const std::vector<uint8_t>& original, const std::vector<uint8_t>& extracted);

}
}

#endif // METRICS_HPP
