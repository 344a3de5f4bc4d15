#include "../include/fingerprint.hpp"
#include "../include/errors.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <charconv>
#include <format>

namespace snapmatch {

namespace {

struct Span {
    int cell;
    uint64_t weight;
};

// For every source index, the output cells it overlaps and by how much.
// Source pixel s covers [s*cells, (s+1)*cells) and output cell d covers
// [d*srcLen, (d+1)*srcLen), so every output cell has the same total weight.
std::vector<std::vector<Span>> axisSpans(int srcLen, int cells)
{
    const uint64_t n = static_cast<uint64_t>(cells);
    const uint64_t len = static_cast<uint64_t>(srcLen);

    std::vector<std::vector<Span>> spans(static_cast<size_t>(srcLen));
    for (uint64_t s = 0; s < len; ++s) {
        const uint64_t begin = s * n;
        const uint64_t end = begin + n;
        for (uint64_t d = begin / len; d < n && d * len < end; ++d) {
            const uint64_t overlap = std::min(end, (d + 1) * len) - std::max(begin, d * len);
            if (overlap > 0) spans[s].push_back({ static_cast<int>(d), overlap });
        }
    }
    return spans;
}

} // namespace

std::string ImageFingerprint::to_string() const
{
    return std::format("{:016x}", bits);
}

std::optional<ImageFingerprint> ImageFingerprint::parse(std::string_view hex)
{
    if (hex.size() != 16) return std::nullopt;

    uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), value, 16);
    if (ec != std::errc{} || ptr != hex.data() + hex.size()) return std::nullopt;

    return ImageFingerprint{ value };
}

ImageFingerprint computeFingerprint(const GrayImage& image)
{
    if (image.width <= 0 || image.height <= 0) {
        throw DecodeError(std::format("empty pixel grid ({}x{})", image.width, image.height));
    }
    if (image.pixels.size() != static_cast<size_t>(image.width) * static_cast<size_t>(image.height)) {
        throw DecodeError(std::format("pixel buffer holds {} samples, expected {}x{}",
                                      image.pixels.size(), image.width, image.height));
    }

    const auto xSpans = axisSpans(image.width, kGridWidth);
    const auto ySpans = axisSpans(image.height, kGridHeight);

    // Area sums per output cell. Comparing sums is exact since all cells share one area.
    std::array<std::array<uint64_t, kGridWidth>, kGridHeight> cells{};
    std::array<uint64_t, kGridWidth> rowSums{};

    for (int y = 0; y < image.height; ++y) {
        rowSums.fill(0);
        const uint8_t* row = image.pixels.data() + static_cast<size_t>(y) * image.width;
        for (int x = 0; x < image.width; ++x) {
            for (const Span& sx : xSpans[x]) {
                rowSums[sx.cell] += sx.weight * row[x];
            }
        }
        for (const Span& sy : ySpans[y]) {
            for (int c = 0; c < kGridWidth; ++c) {
                cells[sy.cell][c] += sy.weight * rowSums[c];
            }
        }
    }

    uint64_t bits = 0;
    for (int r = 0; r < kGridHeight; ++r) {
        for (int c = 0; c < kGridWidth - 1; ++c) {
            bits <<= 1;
            if (cells[r][c] > cells[r][c + 1]) bits |= 1;
        }
    }

    return ImageFingerprint{ bits };
}

int hammingDistance(ImageFingerprint a, ImageFingerprint b) noexcept
{
    return std::popcount(a.bits ^ b.bits);
}

} // namespace snapmatch
