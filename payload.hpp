#ifndef PAYLOAD_HPP
#define PAYLOAD_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace sonicpx {

    struct DecodedFile {
        std::vector<uint8_t> data;
        std::string mimeType;
        std::string fileName;
    };

    // magic "SNIC" | dataLength u32 LE | mimeLen u8 | mime | nameLen u8 | name | data
    // Throws CodecError(FieldTooLong) if mime or name exceeds 255 bytes.
    std::vector<uint8_t> framePayload(const std::vector<uint8_t>& data,
                                      const std::string& mimeType,
                                      const std::string& fileName);

    // Accepts "SNIC" and legacy "SNIZ" (gzip) payloads. A buffer shorter than
    // the declared data length yields a partial slice and a warning, since
    // pixel rounding in the noise codec makes the buffer overshoot anyway.
    DecodedFile parsePayload(const std::vector<uint8_t>& buffer);

    // Inflates a single gzip member; throws CodecError(DecompressionFailed)
    std::vector<uint8_t> gunzip(const std::vector<uint8_t>& compressed);

    bool hasPayloadMagic(const uint8_t* probe4);

}

#endif // PAYLOAD_HPP
