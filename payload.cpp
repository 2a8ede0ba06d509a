#include "payload.hpp"

#include "byte_io.hpp"
#include "codec_error.hpp"
#include "sonic_config.hpp"

#include <zlib.h>

#include <cstring>
#include <iostream>
#include <limits>

namespace sonicpx {

    static bool magicEquals(const uint8_t* a, const uint8_t* b) {
        return std::memcmp(a, b, 4) == 0;
    }

    static void checkFieldLength(const std::string& field, const char* what) {
        if (field.size() > MAX_FIELD_BYTES) {
            throw CodecError(ErrorKind::FieldTooLong,
                             std::string(what) + " is " + std::to_string(field.size()) +
                             " bytes, limit is " + std::to_string(MAX_FIELD_BYTES));
        }
    }

    bool hasPayloadMagic(const uint8_t* probe4)
    {
        return magicEquals(probe4, MAGIC_SNIC) || magicEquals(probe4, MAGIC_SNIZ);
    }

    std::vector<uint8_t> framePayload(const std::vector<uint8_t>& data,
                                      const std::string& mimeType,
                                      const std::string& fileName)
    {
        checkFieldLength(mimeType, "mime type");
        checkFieldLength(fileName, "file name");
        if (data.size() > std::numeric_limits<uint32_t>::max()) {
            throw CodecError(ErrorKind::InputTooLarge, "payload does not fit a 32-bit length field");
        }

        // Compression stays off for new payloads: audio is already compressed
        // and a gzip stream does not survive a single flipped pixel.
        ByteWriter w;
        w.reserve(4 + 4 + 1 + mimeType.size() + 1 + fileName.size() + data.size());
        w.writeBytes(MAGIC_SNIC, 4);
        w.writeU32LE(static_cast<uint32_t>(data.size()));
        w.writeU8(static_cast<uint8_t>(mimeType.size()));
        w.writeBytes(mimeType.data(), mimeType.size());
        w.writeU8(static_cast<uint8_t>(fileName.size()));
        w.writeBytes(fileName.data(), fileName.size());
        w.writeBytes(data.data(), data.size());
        return w.release();
    }

    DecodedFile parsePayload(const std::vector<uint8_t>& buffer)
    {
        if (buffer.size() < 4 || !hasPayloadMagic(buffer.data())) {
            throw CodecError(ErrorKind::UnrecognizedPayloadMagic,
                             "payload magic is neither SNIC nor SNIZ");
        }
        const bool compressed = magicEquals(buffer.data(), MAGIC_SNIZ);

        ByteReader r(buffer);
        r.readString(4, "magic");
        const uint32_t dataSize = r.readU32LE("data length");
        const uint8_t mimeLen = r.readU8("mime length");

        DecodedFile out;
        out.mimeType = r.readString(mimeLen, "mime type");
        const uint8_t nameLen = r.readU8("name length");
        out.fileName = r.readString(nameLen, "file name");

        if (r.remaining() < dataSize) {
            std::cerr << "[parse] Buffer mismatch. Expected " << (r.position() + dataSize)
                      << ", got " << buffer.size() << ". Attempting partial read.\n";
        }
        out.data = r.readUpTo(dataSize);

        if (compressed) {
            out.data = gunzip(out.data);
        }
        return out;
    }

    std::vector<uint8_t> gunzip(const std::vector<uint8_t>& compressed)
    {
        z_stream zs;
        std::memset(&zs, 0, sizeof(zs));

        // 16 + MAX_WBITS: expect a gzip wrapper rather than raw zlib
        if (inflateInit2(&zs, 16 + MAX_WBITS) != Z_OK) {
            throw CodecError(ErrorKind::DecompressionFailed, "inflateInit2 failed");
        }

        zs.next_in = const_cast<Bytef*>(compressed.data());
        zs.avail_in = static_cast<uInt>(compressed.size());

        std::vector<uint8_t> out;
        uint8_t chunk[16384];
        int ret = Z_OK;
        do {
            zs.next_out = chunk;
            zs.avail_out = sizeof(chunk);
            ret = inflate(&zs, Z_NO_FLUSH);
            if (ret != Z_OK && ret != Z_STREAM_END) {
                std::string msg = zs.msg ? zs.msg : "inflate error";
                inflateEnd(&zs);
                std::cerr << "[parse] Decompression failed: " << msg << "\n";
                throw CodecError(ErrorKind::DecompressionFailed, "gzip: " + msg);
            }
            out.insert(out.end(), chunk, chunk + (sizeof(chunk) - zs.avail_out));
        } while (ret != Z_STREAM_END);

        inflateEnd(&zs);
        return out;
    }

}
