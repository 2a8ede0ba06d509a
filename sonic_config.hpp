#ifndef SONIC_CONFIG_HPP
#define SONIC_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace sonicpx {

    // Payload-level magics ("SNIC" raw, "SNIZ" legacy gzip) and the stego container magic
    constexpr uint8_t MAGIC_SNIC[4] = { 0x53, 0x4E, 0x49, 0x43 };
    constexpr uint8_t MAGIC_SNIZ[4] = { 0x53, 0x4E, 0x49, 0x5A };
    constexpr uint8_t MAGIC_SNIH[4] = { 0x53, 0x4E, 0x49, 0x48 };

    // First pixels of a stego image, read linearly at 1 bit/channel.
    // 72 header bits use 24 of them, the rest is padding.
    constexpr int RESERVED_HEADER_PIXELS = 32;
    constexpr int STEGO_HEADER_BITS = 72;

    // Shuffle PRNG. Changing either value breaks every image already encoded.
    constexpr uint32_t SHUFFLE_SEED = 1337u ^ 0xDEADBEEFu;
    constexpr uint32_t SHUFFLE_INCREMENT = 0x6D2B79F5u;

    // Capacity planning: above this utilization the cover is upscaled by HEADROOM_SCALE
    constexpr double UTILIZATION_THRESHOLD = 0.5;
    constexpr double HEADROOM_SCALE = 1.25;

    constexpr int DEFAULT_BPC = 3;
    constexpr int MIN_BPC = 1;
    constexpr int MAX_ENCODE_BPC = 7;
    constexpr int MAX_DECODE_BPC = 8;

    constexpr size_t MAX_FIELD_BYTES = 255;
    constexpr size_t MAX_INPUT_BYTES = 50u * 1024u * 1024u;

}

#endif // SONIC_CONFIG_HPP
