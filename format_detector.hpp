#ifndef FORMAT_DETECTOR_HPP
#define FORMAT_DETECTOR_HPP

#include "image_stego.hpp"
#include "pixel_buffer.hpp"

namespace sonicpx {

    enum class ImageFormat {
        Noise,
        Stego
    };

    struct Detection {
        ImageFormat format = ImageFormat::Noise;
        StegoHeader stego; // only filled for ImageFormat::Stego
    };

    // Raw probe first (SNIC/SNIZ at pixel0.RGB + pixel1.R), then the linear
    // LSB SNIH header. Throws CodecError(UnrecognizedFormat) if neither
    // matches, CodecError(InvalidStegoHeader) if SNIH carries bad fields.
    Detection detectFormat(const PixelBuffer& pixels);

}

#endif // FORMAT_DETECTOR_HPP
