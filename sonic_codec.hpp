#ifndef SONIC_CODEC_HPP
#define SONIC_CODEC_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "capacity_planner.hpp"
#include "payload.hpp"
#include "pixel_buffer.hpp"
#include "sonic_config.hpp"

// In-memory entry points. All failures are CodecError with a kind.
namespace sonicpx {

    // Every pixel is payload
    PixelBuffer encodeNoise(const std::vector<uint8_t>& fileBytes,
                            const std::string& mimeType,
                            const std::string& fileName);

    // Hides the file inside cover, upscaling the cover if needed.
    // targetBpc must be in [1,7]. planOut, if given, receives the sizing decision.
    PixelBuffer encodeStego(const std::vector<uint8_t>& fileBytes,
                            const std::string& mimeType,
                            const std::string& fileName,
                            const PixelBuffer& cover,
                            int targetBpc = DEFAULT_BPC,
                            CapacityPlan* planOut = nullptr);

    // Noise or stego, whichever the pixels carry
    DecodedFile decode(const PixelBuffer& pixels);

}

#endif // SONIC_CODEC_HPP
