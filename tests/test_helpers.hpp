#ifndef SONICPX_TEST_HELPERS_HPP
#define SONICPX_TEST_HELPERS_HPP

#include <gtest/gtest.h>

#include <zlib.h>

#include <cstdint>
#include <cstring>
#include <random>
#include <vector>

#include "codec_error.hpp"
#include "pixel_buffer.hpp"

// Runs stmt and checks it throws CodecError of the given kind
#define EXPECT_CODEC_ERROR(stmt, expectedKind)                                  \
    do {                                                                        \
        bool thrown_ = false;                                                   \
        try {                                                                   \
            stmt;                                                               \
        } catch (const sonicpx::CodecError& e) {                                \
            thrown_ = true;                                                     \
            EXPECT_EQ(e.kind(), expectedKind)                                   \
                << "got " << sonicpx::errorKindName(e.kind()) << ": " << e.what(); \
        }                                                                       \
        EXPECT_TRUE(thrown_) << "expected CodecError " << #expectedKind;        \
    } while (0)

inline std::vector<uint8_t> randomBytes(size_t n, uint32_t seed)
{
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::vector<uint8_t> out(n);
    for (size_t i = 0; i < n; ++i) {
        out[i] = static_cast<uint8_t>(dist(gen));
    }
    return out;
}

// Opaque gradient with every channel value in use somewhere
inline sonicpx::PixelBuffer gradientCover(int w, int h)
{
    sonicpx::PixelBuffer img(w, h);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            uint8_t* px = img.pixel(static_cast<size_t>(y) * w + x);
            px[0] = static_cast<uint8_t>((x * 7 + y * 3) & 0xFF);
            px[1] = static_cast<uint8_t>((x * 13 + y * 29 + 128) & 0xFF);
            px[2] = static_cast<uint8_t>(255 - ((x + y) * 5 & 0xFF));
            px[3] = 255;
        }
    }
    return img;
}

inline sonicpx::PixelBuffer solidCover(int w, int h, uint8_t value)
{
    sonicpx::PixelBuffer img(w, h);
    std::memset(img.rgba.data(), value, img.rgba.size());
    sonicpx::forceOpaque(img);
    return img;
}

inline std::vector<uint8_t> gzipBytes(const std::vector<uint8_t>& in)
{
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    EXPECT_EQ(deflateInit2(&zs, Z_BEST_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY), Z_OK);

    std::vector<uint8_t> out(deflateBound(&zs, static_cast<uLong>(in.size())) + 64);
    zs.next_in = const_cast<Bytef*>(in.data());
    zs.avail_in = static_cast<uInt>(in.size());
    zs.next_out = out.data();
    zs.avail_out = static_cast<uInt>(out.size());
    EXPECT_EQ(deflate(&zs, Z_FINISH), Z_STREAM_END);
    out.resize(zs.total_out);
    deflateEnd(&zs);
    return out;
}

#endif // SONICPX_TEST_HELPERS_HPP
