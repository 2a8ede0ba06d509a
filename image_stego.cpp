#include "image_stego.hpp"

#include "codec_error.hpp"
#include "shuffle.hpp"
#include "sonic_config.hpp"

#include <iostream>
#include <string>

namespace sonicpx {

    static void advance(LsbCursor& cursor) {
        if (++cursor.channel > 2) {
            cursor.channel = 0;
            ++cursor.pixel;
        }
    }

    static void requireHeaderSpace(const PixelBuffer& pixels) {
        if (pixels.pixelCount() < static_cast<size_t>(RESERVED_HEADER_PIXELS)) {
            throw CodecError(ErrorKind::InvalidArgument,
                             "image has " + std::to_string(pixels.pixelCount()) +
                             " pixels, header needs " + std::to_string(RESERVED_HEADER_PIXELS));
        }
    }

    uint8_t applyOpap(uint8_t original, uint8_t modified, int bpc)
    {
        const int delta = static_cast<int>(modified) - static_cast<int>(original);
        const int interval = 1 << bpc;
        const int limit = 1 << (bpc - 1);

        if (delta > limit && static_cast<int>(modified) - interval >= 0) {
            return static_cast<uint8_t>(modified - interval);
        }
        if (delta < -limit && static_cast<int>(modified) + interval <= 255) {
            return static_cast<uint8_t>(modified + interval);
        }
        return modified;
    }

    uint8_t readLinearByte(const PixelBuffer& pixels, LsbCursor& cursor)
    {
        uint8_t value = 0;
        for (int b = 0; b < 8; ++b) {
            const uint8_t bit = pixels.pixel(cursor.pixel)[cursor.channel] & 1;
            value |= static_cast<uint8_t>(bit << b);
            advance(cursor);
        }
        return value;
    }

    void writeLinearByte(PixelBuffer& pixels, LsbCursor& cursor, uint8_t value)
    {
        for (int b = 0; b < 8; ++b) {
            uint8_t& ch = pixels.pixel(cursor.pixel)[cursor.channel];
            ch = static_cast<uint8_t>((ch & 0xFE) | ((value >> b) & 1));
            advance(cursor);
        }
    }

    void writeStegoHeader(PixelBuffer& pixels, uint32_t payloadLength, int bpc)
    {
        requireHeaderSpace(pixels);

        // Header density is fixed at 1 bit so it reads back whatever the payload bpc
        LsbCursor cursor;
        for (int i = 0; i < 4; ++i) {
            writeLinearByte(pixels, cursor, MAGIC_SNIH[i]);
        }
        for (int i = 0; i < 4; ++i) {
            writeLinearByte(pixels, cursor, static_cast<uint8_t>((payloadLength >> (8 * i)) & 0xFF));
        }
        writeLinearByte(pixels, cursor, static_cast<uint8_t>(bpc));
    }

    bool readStegoMagic(const PixelBuffer& pixels, LsbCursor& cursor)
    {
        if (pixels.pixelCount() < static_cast<size_t>(RESERVED_HEADER_PIXELS)) {
            return false;
        }
        bool match = true;
        for (int i = 0; i < 4; ++i) {
            if (readLinearByte(pixels, cursor) != MAGIC_SNIH[i]) {
                match = false;
            }
        }
        return match;
    }

    StegoHeader readStegoHeaderFields(const PixelBuffer& pixels, LsbCursor cursor)
    {
        StegoHeader hdr;
        for (int i = 0; i < 4; ++i) {
            hdr.payloadLength |= static_cast<uint32_t>(readLinearByte(pixels, cursor)) << (8 * i);
        }
        hdr.bitsPerChannel = readLinearByte(pixels, cursor);
        hdr.payloadStart = cursor;

        if (hdr.bitsPerChannel < MIN_BPC || hdr.bitsPerChannel > MAX_DECODE_BPC) {
            throw CodecError(ErrorKind::InvalidStegoHeader,
                             "invalid bits per channel in header: " + std::to_string(hdr.bitsPerChannel));
        }
        const uint64_t capacityBytes = static_cast<uint64_t>(pixels.pixelCount()) * 3u *
                                       static_cast<uint64_t>(hdr.bitsPerChannel) / 8u;
        if (hdr.payloadLength > capacityBytes) {
            throw CodecError(ErrorKind::InvalidStegoHeader,
                             "header payload length " + std::to_string(hdr.payloadLength) +
                             " exceeds image capacity " + std::to_string(capacityBytes));
        }
        return hdr;
    }

    size_t embedPayloadBits(PixelBuffer& pixels, const std::vector<uint8_t>& payload, int bpc)
    {
        const std::vector<uint32_t> order =
            shuffledPixelIndices(static_cast<uint32_t>(pixels.pixelCount()), RESERVED_HEADER_PIXELS);
        const uint8_t mask = static_cast<uint8_t>((1 << bpc) - 1);

        size_t byteIdx = 0;
        int bitIdx = 0;
        size_t orderIdx = 0;

        while (byteIdx < payload.size()) {
            if (orderIdx >= order.size()) {
                std::cerr << "[embed] Ran out of pixels after " << byteIdx << " of "
                          << payload.size() << " bytes; payload truncated.\n";
                break;
            }
            uint8_t* px = pixels.pixel(order[orderIdx]);

            for (int c = 0; c < 3; ++c) {
                uint8_t bits = 0;
                for (int b = 0; b < bpc && byteIdx < payload.size(); ++b) {
                    bits |= static_cast<uint8_t>(((payload[byteIdx] >> bitIdx) & 1) << b);
                    if (++bitIdx == 8) {
                        bitIdx = 0;
                        ++byteIdx;
                    }
                }

                const uint8_t original = px[c];
                uint8_t modified = static_cast<uint8_t>((original & ~mask) | bits);
                if (bpc < 8) {
                    modified = applyOpap(original, modified, bpc);
                }
                px[c] = modified;

                if (byteIdx >= payload.size()) {
                    break;
                }
            }
            ++orderIdx;
        }
        return byteIdx;
    }

    std::vector<uint8_t> extractPayloadBits(const PixelBuffer& pixels, uint32_t length, int bpc)
    {
        const std::vector<uint32_t> order =
            shuffledPixelIndices(static_cast<uint32_t>(pixels.pixelCount()), RESERVED_HEADER_PIXELS);
        const uint8_t mask = static_cast<uint8_t>((1 << bpc) - 1);

        std::vector<uint8_t> payload(length, 0);
        size_t byteIdx = 0;
        int bitIdx = 0;
        uint8_t current = 0;
        size_t orderIdx = 0;

        while (byteIdx < length) {
            if (orderIdx >= order.size()) {
                std::cerr << "[extract] Ran out of pixels after " << byteIdx << " of "
                          << length << " bytes.\n";
                break;
            }
            const uint8_t* px = pixels.pixel(order[orderIdx]);

            for (int c = 0; c < 3 && byteIdx < length; ++c) {
                const uint8_t bits = px[c] & mask;
                for (int b = 0; b < bpc; ++b) {
                    current |= static_cast<uint8_t>(((bits >> b) & 1) << bitIdx);
                    if (++bitIdx == 8) {
                        payload[byteIdx++] = current;
                        bitIdx = 0;
                        current = 0;
                        if (byteIdx >= length) {
                            break;
                        }
                    }
                }
            }
            ++orderIdx;
        }
        return payload;
    }

}
