#include "format_detector.hpp"

#include "codec_error.hpp"
#include "noise_codec.hpp"

namespace sonicpx {

    Detection detectFormat(const PixelBuffer& pixels)
    {
        Detection d;
        if (looksLikeNoiseImage(pixels)) {
            d.format = ImageFormat::Noise;
            return d;
        }

        LsbCursor cursor;
        if (readStegoMagic(pixels, cursor)) {
            d.format = ImageFormat::Stego;
            d.stego = readStegoHeaderFields(pixels, cursor);
            return d;
        }

        throw CodecError(ErrorKind::UnrecognizedFormat,
                         "no SNIC/SNIZ probe bytes and no SNIH header");
    }

}
