#include "sonic_codec.hpp"

#include "codec_error.hpp"
#include "format_detector.hpp"
#include "image_io.hpp"
#include "image_stego.hpp"
#include "noise_codec.hpp"

#include <iostream>

namespace sonicpx {

    PixelBuffer encodeNoise(const std::vector<uint8_t>& fileBytes,
                            const std::string& mimeType,
                            const std::string& fileName)
    {
        const std::vector<uint8_t> framed = framePayload(fileBytes, mimeType, fileName);
        return encodeNoisePixels(framed);
    }

    PixelBuffer encodeStego(const std::vector<uint8_t>& fileBytes,
                            const std::string& mimeType,
                            const std::string& fileName,
                            const PixelBuffer& cover,
                            int targetBpc,
                            CapacityPlan* planOut)
    {
        if (cover.empty()) {
            throw CodecError(ErrorKind::InvalidArgument, "cover image is empty");
        }
        const std::vector<uint8_t> payload = framePayload(fileBytes, mimeType, fileName);
        const uint64_t payloadBits = static_cast<uint64_t>(payload.size()) * 8u;

        const CapacityPlan plan = planCapacity(payloadBits, cover.width, cover.height, targetBpc);
        if (planOut) {
            *planOut = plan;
        }
        if (plan.scale > 1.0) {
            std::cout << "[embed] Upscaling cover " << cover.width << "x" << cover.height
                      << " -> " << plan.newWidth << "x" << plan.newHeight
                      << " (utilization " << plan.utilization << ")\n";
        }

        PixelBuffer pixels = resampleCover(cover, plan.newWidth, plan.newHeight, plan.scale > 1.0);
        forceOpaque(pixels);

        writeStegoHeader(pixels, static_cast<uint32_t>(payload.size()), plan.bitsPerChannel);
        embedPayloadBits(pixels, payload, plan.bitsPerChannel);
        return pixels;
    }

    DecodedFile decode(const PixelBuffer& pixels)
    {
        const Detection d = detectFormat(pixels);
        if (d.format == ImageFormat::Noise) {
            return parsePayload(extractNoiseBytes(pixels));
        }
        return parsePayload(extractPayloadBits(pixels, d.stego.payloadLength, d.stego.bitsPerChannel));
    }

}
