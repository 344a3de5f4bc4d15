//
// fingerprint.hpp
// 64-bit difference hash (dHash) of a grayscale pixel grid
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace snapmatch {

// Bumped whenever the resampling, comparison or bit packing changes.
// Cached fingerprints from another version are never reused.
constexpr int kAlgorithmVersion = 1;

constexpr int kGridWidth = 9;
constexpr int kGridHeight = 8;
constexpr int kFingerprintBits = 64;

/**
 * Row-major 8-bit luminance grid as produced by an ImageDecoder.
 * pixels.size() must equal width * height.
 */
struct GrayImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;

    uint8_t at(int x, int y) const { return pixels[static_cast<size_t>(y) * width + x]; }
};

/**
 * Bit 63 holds row 0 / pair 0, bit 0 holds row 7 / pair 7.
 * A bit is set when the left cell is brighter than its right neighbour.
 */
struct ImageFingerprint {
    uint64_t bits = 0;

    // 16 lowercase hex digits
    std::string to_string() const;
    static std::optional<ImageFingerprint> parse(std::string_view hex);

    bool operator==(const ImageFingerprint&) const = default;
};

/**
 * Compute the dHash of a decoded image.
 * @throws DecodeError if the grid is empty or inconsistent
 */
ImageFingerprint computeFingerprint(const GrayImage& image);

// popcount(a ^ b), always in [0, 64]
int hammingDistance(ImageFingerprint a, ImageFingerprint b) noexcept;

} // namespace snapmatch
