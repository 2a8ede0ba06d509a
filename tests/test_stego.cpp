// test_stego.cpp - LSB header, OPAP, shuffled payload and stego round trips.

#include "test_helpers.hpp"

#include "format_detector.hpp"
#include "image_stego.hpp"
#include "shuffle.hpp"
#include "sonic_codec.hpp"
#include "sonic_config.hpp"

#include <algorithm>
#include <cstdlib>

using namespace sonicpx;

TEST(OpapTest, KeepsLowBitsAndPicksNearest)
{
    for (int bpc = 1; bpc <= 7; ++bpc) {
        const int mask = (1 << bpc) - 1;
        const int interval = 1 << bpc;
        for (int original = 0; original < 256; ++original) {
            for (int target = 0; target <= mask; ++target) {
                const int modified = (original & ~mask) | target;
                const int out = applyOpap(static_cast<uint8_t>(original), static_cast<uint8_t>(modified), bpc);

                ASSERT_EQ(out & mask, target);
                ASSERT_TRUE(out == modified || out == modified - interval || out == modified + interval);

                int best = std::abs(modified - original);
                if (modified - interval >= 0) best = std::min(best, std::abs(modified - interval - original));
                if (modified + interval <= 255) best = std::min(best, std::abs(modified + interval - original));
                ASSERT_EQ(std::abs(out - original), best)
                    << "bpc " << bpc << " original " << original << " modified " << modified;
            }
        }
    }
}

TEST(OpapTest, ConcreteAdjustments)
{
    // 3 bpc: 0x40 -> 0x47 moves up 7, 0x3F (down 1) is better
    EXPECT_EQ(applyOpap(0x40, 0x47, 3), 0x3F);
    // 3 bpc: 0x47 -> 0x40 moves down 7, 0x48 (up 1) is better
    EXPECT_EQ(applyOpap(0x47, 0x40, 3), 0x48);
    // a delta equal to the limit stays put
    EXPECT_EQ(applyOpap(0x40, 0x44, 3), 0x44);
    // no room below zero
    EXPECT_EQ(applyOpap(0x00, 0x07, 3), 0x07);
    // no room above 255
    EXPECT_EQ(applyOpap(0xFF, 0xF8, 3), 0xF8);
}

TEST(StegoHeaderTest, WriteThenRead)
{
    PixelBuffer img = gradientCover(8, 8);
    // capacity check allows up to 8*8*3*5/8 = 120 bytes
    writeStegoHeader(img, 120, 5);

    LsbCursor cursor;
    ASSERT_TRUE(readStegoMagic(img, cursor));
    EXPECT_EQ(cursor.pixel, 10u);
    EXPECT_EQ(cursor.channel, 2);

    StegoHeader hdr = readStegoHeaderFields(img, cursor);
    EXPECT_EQ(hdr.payloadLength, 120u);
    EXPECT_EQ(hdr.bitsPerChannel, 5);
    EXPECT_EQ(hdr.payloadStart.pixel, 24u);
    EXPECT_EQ(hdr.payloadStart.channel, 0);
}

TEST(StegoHeaderTest, TouchesOnlyLowBitOfHeaderPixels)
{
    const PixelBuffer cover = gradientCover(8, 8);
    PixelBuffer img = cover;
    writeStegoHeader(img, 100, 3);

    for (size_t i = 0; i < img.rgba.size(); ++i) {
        const size_t px = i / 4;
        const size_t ch = i % 4;
        if (px < 24 && ch < 3) {
            ASSERT_EQ(img.rgba[i] & 0xFE, cover.rgba[i] & 0xFE);
        } else {
            ASSERT_EQ(img.rgba[i], cover.rgba[i]);
        }
    }
}

TEST(StegoHeaderTest, TooFewPixelsForHeader)
{
    PixelBuffer img = gradientCover(4, 4);
    EXPECT_CODEC_ERROR(writeStegoHeader(img, 1, 1), ErrorKind::InvalidArgument);
}

TEST(StegoEmbedTest, StopsMidPixel)
{
    const PixelBuffer cover = solidCover(8, 8, 100);
    PixelBuffer img = cover;

    // 4 bpc: one byte fills R and G of the first shuffled pixel, B is untouched
    EXPECT_EQ(embedPayloadBits(img, { 0xAB }, 4), 1u);

    const uint32_t first = shuffledPixelIndices(64, RESERVED_HEADER_PIXELS).front();
    EXPECT_EQ(first, 56u);
    EXPECT_EQ(img.pixel(first)[0], 0x6B);
    EXPECT_EQ(img.pixel(first)[1], 0x6A);
    EXPECT_EQ(img.pixel(first)[2], 100);

    for (size_t i = 0; i < img.pixelCount(); ++i) {
        if (i == first) continue;
        ASSERT_EQ(std::memcmp(img.pixel(i), cover.pixel(i), 4), 0) << "pixel " << i;
    }

    EXPECT_EQ(extractPayloadBits(img, 1, 4), (std::vector<uint8_t>{ 0xAB }));
}

TEST(StegoEmbedTest, TruncatesWhenPixelsRunOut)
{
    PixelBuffer img = solidCover(8, 8, 50);
    const std::vector<uint8_t> payload = randomBytes(20, 5);

    // 32 payload pixels * 3 channels * 1 bpc = 96 bits = 12 bytes
    EXPECT_EQ(embedPayloadBits(img, payload, 1), 12u);

    std::vector<uint8_t> back = extractPayloadBits(img, 20, 1);
    ASSERT_EQ(back.size(), 20u);
    EXPECT_TRUE(std::equal(payload.begin(), payload.begin() + 12, back.begin()));
    EXPECT_TRUE(std::all_of(back.begin() + 12, back.end(), [](uint8_t b) { return b == 0; }));
}

TEST(StegoRoundTripTest, AllDensities)
{
    const std::vector<uint8_t> data = randomBytes(500, 42);
    for (int bpc = MIN_BPC; bpc <= MAX_ENCODE_BPC; ++bpc) {
        const PixelBuffer cover = gradientCover(64, 48);
        CapacityPlan plan;
        PixelBuffer img = encodeStego(data, "audio/mpeg", "song.mp3", cover, bpc, &plan);

        EXPECT_EQ(img.width, plan.newWidth);
        EXPECT_EQ(img.height, plan.newHeight);

        Detection d = detectFormat(img);
        ASSERT_EQ(d.format, ImageFormat::Stego);
        EXPECT_EQ(d.stego.bitsPerChannel, bpc);

        DecodedFile out = decode(img);
        EXPECT_EQ(out.data, data) << "bpc " << bpc;
        EXPECT_EQ(out.mimeType, "audio/mpeg");
        EXPECT_EQ(out.fileName, "song.mp3");
    }
}

TEST(StegoRoundTripTest, UpscaledSmallCover)
{
    const std::vector<uint8_t> data = randomBytes(4000, 9);
    const PixelBuffer cover = gradientCover(8, 8);

    CapacityPlan plan;
    PixelBuffer img = encodeStego(data, "audio/wav", "big.wav", cover, 2, &plan);
    EXPECT_GT(plan.scale, 1.0);
    EXPECT_GT(img.pixelCount(), cover.pixelCount());

    for (size_t i = 0; i < img.pixelCount(); ++i) {
        ASSERT_EQ(img.pixel(i)[3], 255);
    }

    DecodedFile out = decode(img);
    EXPECT_EQ(out.data, data);
    EXPECT_EQ(out.fileName, "big.wav");
}

TEST(StegoRoundTripTest, EmptyFileAndExtremeCovers)
{
    const uint8_t levels[] = { 0, 255 };
    for (uint8_t level : levels) {
        const PixelBuffer cover = solidCover(16, 16, level);
        PixelBuffer img = encodeStego({}, "audio/ogg", "silence.ogg", cover, 7);
        DecodedFile out = decode(img);
        EXPECT_TRUE(out.data.empty());
        EXPECT_EQ(out.fileName, "silence.ogg");
    }
}

TEST(StegoRoundTripTest, DistortionBoundedByDensity)
{
    // Mid-range values, so OPAP never has to stay on the far side of 0 or 255
    PixelBuffer cover(200, 200);
    for (size_t i = 0; i < cover.rgba.size(); ++i) {
        cover.rgba[i] = static_cast<uint8_t>(16 + (i * 37) % 224);
    }
    forceOpaque(cover);
    const std::vector<uint8_t> data = randomBytes(2000, 77);
    const int bpc = 2;

    CapacityPlan plan;
    PixelBuffer img = encodeStego(data, "audio/mpeg", "a.mp3", cover, bpc, &plan);
    ASSERT_DOUBLE_EQ(plan.scale, 1.0);

    // OPAP keeps every channel within half an interval of the cover
    const int limit = 1 << (bpc - 1);
    for (size_t i = 0; i < img.rgba.size(); ++i) {
        if (i % 4 == 3) continue;
        ASSERT_LE(std::abs(static_cast<int>(img.rgba[i]) - static_cast<int>(cover.rgba[i])), limit);
    }
}

TEST(StegoRoundTripTest, RejectsOutOfRangeDensity)
{
    const PixelBuffer cover = gradientCover(16, 16);
    EXPECT_CODEC_ERROR(encodeStego({ 1 }, "a", "b", cover, 0), ErrorKind::InvalidArgument);
    EXPECT_CODEC_ERROR(encodeStego({ 1 }, "a", "b", cover, 8), ErrorKind::InvalidArgument);
    EXPECT_CODEC_ERROR(encodeStego({ 1 }, "a", "b", PixelBuffer(), 3), ErrorKind::InvalidArgument);
}

TEST(StegoHeaderTest, LengthAtCapacityIsAccepted)
{
    PixelBuffer img = solidCover(8, 8, 0);
    writeStegoHeader(img, 24, 1); // 8*8*3*1/8

    LsbCursor cursor;
    ASSERT_TRUE(readStegoMagic(img, cursor));
    EXPECT_EQ(readStegoHeaderFields(img, cursor).payloadLength, 24u);
}
