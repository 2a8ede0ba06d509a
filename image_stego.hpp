#ifndef IMAGE_STEGO_HPP
#define IMAGE_STEGO_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "pixel_buffer.hpp"

// LSB embedding: a linear 1-bit header in the first pixels, the payload
// scattered over the rest in shuffle order with OPAP correction
namespace sonicpx {

    // Position in the linear R,G,B,R,G,B... stream of the header pixels
    struct LsbCursor {
        size_t pixel = 0;
        int channel = 0;
    };

    struct StegoHeader {
        uint32_t payloadLength = 0;
        int bitsPerChannel = 0;
        LsbCursor payloadStart; // where the header stream ended
    };

    // Among values with the same low bpc bits as modified, prefer the one
    // closest to original (modified - 2^bpc or modified + 2^bpc if in range)
    uint8_t applyOpap(uint8_t original, uint8_t modified, int bpc);

    // One LSB per channel; the cursor advances R -> G -> B -> next pixel
    uint8_t readLinearByte(const PixelBuffer& pixels, LsbCursor& cursor);
    void writeLinearByte(PixelBuffer& pixels, LsbCursor& cursor, uint8_t value);

    // "SNIH" | length u32 LE | bpc u8 at 1 bit/channel from pixel 0
    void writeStegoHeader(PixelBuffer& pixels, uint32_t payloadLength, int bpc);

    // Reads the 32 magic bits only; true when they spell SNIH
    bool readStegoMagic(const PixelBuffer& pixels, LsbCursor& cursor);

    // Continues after readStegoMagic. Throws CodecError(InvalidStegoHeader)
    // unless 1 <= bpc <= 8 and length <= width*height*3*bpc/8.
    StegoHeader readStegoHeaderFields(const PixelBuffer& pixels, LsbCursor cursor);

    // Writes payload bits into the shuffled pixels. Returns the number of
    // bytes fully written; stops short only if the image runs out of pixels.
    size_t embedPayloadBits(PixelBuffer& pixels, const std::vector<uint8_t>& payload, int bpc);

    // Always returns `length` bytes; the tail stays zero if the image runs out
    std::vector<uint8_t> extractPayloadBits(const PixelBuffer& pixels, uint32_t length, int bpc);

}

#endif // IMAGE_STEGO_HPP
