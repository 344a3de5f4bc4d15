// dHash computation, hex form and Hamming distance

#include <gtest/gtest.h>

#include "errors.hpp"
#include "fingerprint.hpp"
#include "test_utils.hpp"

using namespace snapmatch;
using snapmatch_test::blockImage;
using snapmatch_test::patternValues;

namespace {

GrayImage gridImage(int width, int height, uint8_t fill = 0)
{
    GrayImage img;
    img.width = width;
    img.height = height;
    img.pixels.assign(static_cast<size_t>(width) * height, fill);
    return img;
}

} // namespace

TEST(FingerprintTests, UniformImageHasNoBitsSet) {
    EXPECT_EQ(computeFingerprint(gridImage(9, 8, 128)).bits, 0u);
    EXPECT_EQ(computeFingerprint(gridImage(640, 480, 17)).bits, 0u);
}

TEST(FingerprintTests, DecreasingGradientSetsEveryBit) {
    GrayImage img = gridImage(9, 8);
    for (int y = 0; y < 8; ++y)
        for (int x = 0; x < 9; ++x)
            img.pixels[static_cast<size_t>(y) * 9 + x] = static_cast<uint8_t>(200 - x * 10);

    EXPECT_EQ(computeFingerprint(img).bits, ~uint64_t{ 0 });
}

TEST(FingerprintTests, IncreasingGradientSetsNoBit) {
    GrayImage img = gridImage(9, 8);
    for (int y = 0; y < 8; ++y)
        for (int x = 0; x < 9; ++x)
            img.pixels[static_cast<size_t>(y) * 9 + x] = static_cast<uint8_t>(10 + x * 10);

    EXPECT_EQ(computeFingerprint(img).bits, 0u);
}

TEST(FingerprintTests, FirstRowFirstPairIsMostSignificantBit) {
    GrayImage img = gridImage(9, 8);
    img.pixels[0] = 255;

    EXPECT_EQ(computeFingerprint(img).bits, uint64_t{ 1 } << 63);
}

TEST(FingerprintTests, LastRowLastPairIsLeastSignificantBit) {
    GrayImage img = gridImage(9, 8);
    img.pixels[7 * 9 + 7] = 255;

    EXPECT_EQ(computeFingerprint(img).bits, uint64_t{ 1 });
}

TEST(FingerprintTests, BlockUpscaleKeepsFingerprint) {
    const auto values = patternValues(3);
    const auto small = computeFingerprint(blockImage(values, 1, 1));

    EXPECT_EQ(computeFingerprint(blockImage(values, 10, 10)), small);
    EXPECT_EQ(computeFingerprint(blockImage(values, 37, 5)), small);
}

TEST(FingerprintTests, OddSizesAreDeterministic) {
    GrayImage img = gridImage(13, 11);
    for (size_t i = 0; i < img.pixels.size(); ++i) img.pixels[i] = static_cast<uint8_t>((i * 37) % 251);

    EXPECT_EQ(computeFingerprint(img), computeFingerprint(img));
}

TEST(FingerprintTests, TinyImageIsAccepted) {
    EXPECT_EQ(computeFingerprint(gridImage(1, 1, 90)).bits, 0u);
}

TEST(FingerprintTests, EmptyGridThrowsDecodeError) {
    EXPECT_THROW(computeFingerprint(GrayImage{}), DecodeError);
    EXPECT_THROW(computeFingerprint(gridImage(0, 8)), DecodeError);
}

TEST(FingerprintTests, InconsistentBufferThrowsDecodeError) {
    GrayImage img = gridImage(9, 8);
    img.pixels.pop_back();
    EXPECT_THROW(computeFingerprint(img), DecodeError);
}

TEST(FingerprintTests, HexIsSixteenLowercaseDigits) {
    EXPECT_EQ(ImageFingerprint{ 0xF0 }.to_string(), "00000000000000f0");
    EXPECT_EQ(ImageFingerprint{ ~uint64_t{ 0 } }.to_string(), "ffffffffffffffff");
}

TEST(FingerprintTests, ParseAcceptsBothCases) {
    auto lower = ImageFingerprint::parse("0123456789abcdef");
    auto upper = ImageFingerprint::parse("0123456789ABCDEF");
    ASSERT_TRUE(lower.has_value());
    ASSERT_TRUE(upper.has_value());
    EXPECT_EQ(lower->bits, 0x0123456789abcdefULL);
    EXPECT_EQ(*lower, *upper);
}

TEST(FingerprintTests, ParseRejectsMalformedText) {
    EXPECT_FALSE(ImageFingerprint::parse("").has_value());
    EXPECT_FALSE(ImageFingerprint::parse("0123456789abcde").has_value());
    EXPECT_FALSE(ImageFingerprint::parse("0123456789abcdef0").has_value());
    EXPECT_FALSE(ImageFingerprint::parse("0123456789abcdeg").has_value());
    EXPECT_FALSE(ImageFingerprint::parse("-123456789abcdef").has_value());
}

TEST(FingerprintTests, HammingDistanceBounds) {
    const ImageFingerprint zero{ 0 };
    const ImageFingerprint ones{ ~uint64_t{ 0 } };
    const ImageFingerprint some{ 0b1011 };

    EXPECT_EQ(hammingDistance(zero, zero), 0);
    EXPECT_EQ(hammingDistance(zero, ones), 64);
    EXPECT_EQ(hammingDistance(zero, some), 3);
    EXPECT_EQ(hammingDistance(some, zero), hammingDistance(zero, some));
    EXPECT_EQ(hammingDistance(some, ones), 61);
}
