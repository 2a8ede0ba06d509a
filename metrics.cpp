#include "metrics.hpp"

#include "codec_error.hpp"
#include "image_io.hpp"

#include <opencv2/opencv.hpp>

#include <bitset>
#include <cmath>

namespace sonicpx {
namespace metrics {

    static void requireSameSize(const PixelBuffer& a, const PixelBuffer& b) {
        if (a.width != b.width || a.height != b.height || a.empty()) {
            throw CodecError(ErrorKind::InvalidArgument, "metrics: images differ in size");
        }
    }

    // 11x11 window, sigma 1.5
    static cv::Mat windowMean(const cv::Mat& src) {
        cv::Mat dst;
        cv::GaussianBlur(src, dst, cv::Size(11, 11), 1.5);
        return dst;
    }

    // E[xy] - E[x]E[y] over the window
    static cv::Mat windowCovariance(const cv::Mat& x, const cv::Mat& y,
                                    const cv::Mat& muX, const cv::Mat& muY) {
        return windowMean(x.mul(y)) - muX.mul(muY);
    }

    static cv::Mat asFloat(const PixelBuffer& pixels) {
        cv::Mat f;
        toBgrMat(pixels).convertTo(f, CV_32F);
        return f;
    }

    // --- PSNR ---
    double computePSNR(const PixelBuffer& a, const PixelBuffer& b)
    {
        requireSameSize(a, b);
        const cv::Mat x = toBgrMat(a);
        const cv::Mat y = toBgrMat(b);

        const double sse = cv::norm(x, y, cv::NORM_L2SQR);
        if (sse <= 1e-10) return 100; // identical
        const double mse = sse / static_cast<double>(x.total() * x.channels());
        return 10.0 * std::log10((255.0 * 255.0) / mse);
    }

    // --- SSIM ---
    // All three channels go through the same maps; the score is their mean.
    double computeSSIM(const PixelBuffer& a, const PixelBuffer& b)
    {
        requireSameSize(a, b);
        const double C1 = 6.5025, C2 = 58.5225; // (0.01*255)^2, (0.03*255)^2

        const cv::Mat x = asFloat(a);
        const cv::Mat y = asFloat(b);
        const cv::Mat muX = windowMean(x);
        const cv::Mat muY = windowMean(y);

        const cv::Mat varX = windowCovariance(x, x, muX, muX);
        const cv::Mat varY = windowCovariance(y, y, muY, muY);
        const cv::Mat covXY = windowCovariance(x, y, muX, muY);

        cv::Mat luminance = 2 * muX.mul(muY) + C1;
        cv::Mat contrast = 2 * covXY + C2;
        cv::Mat numerator = luminance.mul(contrast);
        cv::Mat meanEnergy = muX.mul(muX) + muY.mul(muY) + C1;
        cv::Mat varianceSum = varX + varY + C2;
        cv::Mat denominator = meanEnergy.mul(varianceSum);

        cv::Mat ssimMap;
        cv::divide(numerator, denominator, ssimMap);
        const cv::Scalar perChannel = cv::mean(ssimMap);
        return (perChannel[0] + perChannel[1] + perChannel[2]) / 3.0;
    }

    // --- BER ---
    double computeBER(const std::vector<uint8_t>& original, const std::vector<uint8_t>& extracted)
    {
        if (original.size() != extracted.size()) {
            return 1.0; // 100% wrong
        }
        if (original.empty()) {
            return 0.0;
        }

        size_t bitErrors = 0;
        for (size_t i = 0; i < original.size(); i++) {
            bitErrors += std::bitset<8>(original[i] ^ extracted[i]).count();
        }
        return (double)bitErrors / (double)(original.size() * 8);
    }

}
}
