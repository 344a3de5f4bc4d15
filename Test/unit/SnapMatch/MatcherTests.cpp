// Nearest-neighbour matching: threshold, tie-break and batch decisions

#include <gtest/gtest.h>

#include "errors.hpp"
#include "matcher.hpp"

using namespace snapmatch;

namespace {

constexpr uint64_t kAllOnes = ~uint64_t{ 0 };

// Fingerprint with the lowest `n` bits set
ImageFingerprint lowBits(int n)
{
    return ImageFingerprint{ n >= 64 ? kAllOnes : (uint64_t{ 1 } << n) - 1 };
}

FingerprintResult computed(std::string path, ImageFingerprint fp)
{
    FingerprintResult r;
    r.path = std::move(path);
    r.status = FingerprintStatus::Computed;
    r.fingerprint = fp;
    return r;
}

FingerprintResult failed(std::string path, std::string error)
{
    FingerprintResult r;
    r.path = std::move(path);
    r.status = FingerprintStatus::Failed;
    r.error = std::move(error);
    return r;
}

RawCatalog opposites()
{
    return { { "r1.jpg", ImageFingerprint{ 0 } }, { "r2.jpg", ImageFingerprint{ kAllOnes } } };
}

} // namespace

TEST(MatcherTests, OneBitFlipMatchesNearestRaw) {
    const auto decision = findBest("e.jpg", ImageFingerprint{ uint64_t{ 1 } << 17 }, opposites(), 3);

    EXPECT_EQ(decision.editedPath, "e.jpg");
    EXPECT_EQ(decision.status, MatchStatus::Matched);
    ASSERT_TRUE(decision.matchedRawPath.has_value());
    EXPECT_EQ(*decision.matchedRawPath, "r1.jpg");
    EXPECT_EQ(decision.distance, 1);
}

TEST(MatcherTests, DistantEditIsNoMatch) {
    const auto decision = findBest("e.jpg", lowBits(10), opposites(), 3);

    EXPECT_EQ(decision.status, MatchStatus::NoMatch);
    EXPECT_FALSE(decision.matchedRawPath.has_value());
    EXPECT_FALSE(decision.distance.has_value());
    EXPECT_TRUE(decision.error.empty());
}

TEST(MatcherTests, ThresholdIsInclusive) {
    const RawCatalog catalog = { { "r.jpg", ImageFingerprint{ 0 } } };

    EXPECT_EQ(findBest("e.jpg", lowBits(3), catalog, 3).status, MatchStatus::Matched);
    EXPECT_EQ(findBest("e.jpg", lowBits(4), catalog, 3).status, MatchStatus::NoMatch);
    EXPECT_EQ(findBest("e.jpg", lowBits(0), catalog, 0).status, MatchStatus::Matched);
    EXPECT_EQ(findBest("e.jpg", lowBits(1), catalog, 0).status, MatchStatus::NoMatch);
    EXPECT_EQ(findBest("e.jpg", lowBits(64), catalog, 64).status, MatchStatus::Matched);
}

TEST(MatcherTests, EarliestEntryWinsTies) {
    const RawCatalog catalog = {
        { "far.jpg", lowBits(8) },
        { "first.jpg", ImageFingerprint{ 0b0011 } },
        { "second.jpg", ImageFingerprint{ 0b1100 } },
    };

    const auto decision = findBest("e.jpg", ImageFingerprint{ 0 }, catalog, 5);

    EXPECT_EQ(decision.status, MatchStatus::Matched);
    EXPECT_EQ(decision.matchedRawPath, "first.jpg");
    EXPECT_EQ(decision.distance, 2);
}

TEST(MatcherTests, ExactDuplicatesResolveToFirst) {
    const RawCatalog catalog = {
        { "a.jpg", ImageFingerprint{ 99 } },
        { "b.jpg", ImageFingerprint{ 99 } },
    };

    const auto decision = findBest("e.jpg", ImageFingerprint{ 99 }, catalog, 0);
    EXPECT_EQ(decision.matchedRawPath, "a.jpg");
    EXPECT_EQ(decision.distance, 0);
}

TEST(MatcherTests, EmptyCatalogIsNoMatch) {
    const auto decision = findBest("e.jpg", ImageFingerprint{ 0 }, {}, 64);

    EXPECT_EQ(decision.status, MatchStatus::NoMatch);
    EXPECT_FALSE(decision.matchedRawPath.has_value());
}

TEST(MatcherTests, NegativeMaxDistanceIsConfigurationError) {
    EXPECT_THROW(findBest("e.jpg", ImageFingerprint{ 0 }, opposites(), -1), ConfigurationError);
    EXPECT_THROW(matchAll({}, opposites(), -1), ConfigurationError);
}

TEST(MatcherTests, NegativeWorkerCountIsConfigurationError) {
    EXPECT_THROW(matchAll({ computed("e.jpg", ImageFingerprint{ 0 }) }, opposites(), 3, -1), ConfigurationError);
}

TEST(MatcherTests, StatusNames) {
    EXPECT_EQ(toString(MatchStatus::Matched), "matched");
    EXPECT_EQ(toString(MatchStatus::NoMatch), "no_match");
    EXPECT_EQ(toString(MatchStatus::Error), "error");
}

TEST(MatcherTests, BuildCatalogDropsFailedRawFiles) {
    const auto catalog = buildCatalog({
        computed("r1.jpg", ImageFingerprint{ 1 }),
        failed("broken.jpg", "truncated"),
        computed("r2.jpg", ImageFingerprint{ 2 }),
    });

    ASSERT_EQ(catalog.size(), 2u);
    EXPECT_EQ(catalog[0].path, "r1.jpg");
    EXPECT_EQ(catalog[1].path, "r2.jpg");
}

TEST(MatcherTests, MatchAllKeepsOrderAndReportsErrors) {
    const std::vector<FingerprintResult> edited = {
        computed("near.jpg", ImageFingerprint{ 1 }),
        failed("corrupt.jpg", "not an image"),
        computed("far.jpg", lowBits(20)),
        computed("other.jpg", ImageFingerprint{ kAllOnes - 3 }),
    };

    const auto decisions = matchAll(edited, opposites(), 3);

    ASSERT_EQ(decisions.size(), 4u);
    EXPECT_EQ(decisions[0].status, MatchStatus::Matched);
    EXPECT_EQ(decisions[0].matchedRawPath, "r1.jpg");

    EXPECT_EQ(decisions[1].editedPath, "corrupt.jpg");
    EXPECT_EQ(decisions[1].status, MatchStatus::Error);
    EXPECT_EQ(decisions[1].error, "not an image");
    EXPECT_FALSE(decisions[1].matchedRawPath.has_value());

    EXPECT_EQ(decisions[2].status, MatchStatus::NoMatch);

    EXPECT_EQ(decisions[3].status, MatchStatus::Matched);
    EXPECT_EQ(decisions[3].matchedRawPath, "r2.jpg");
    EXPECT_EQ(decisions[3].distance, 2);
}

TEST(MatcherTests, ManyEditsMayShareOneRaw) {
    const auto decisions = matchAll({ computed("a.jpg", ImageFingerprint{ 0 }), computed("b.jpg", ImageFingerprint{ 4 }) },
                                    opposites(), 3);

    EXPECT_EQ(decisions[0].matchedRawPath, "r1.jpg");
    EXPECT_EQ(decisions[1].matchedRawPath, "r1.jpg");
}

TEST(MatcherTests, MatchAllSameForAnyWorkerCount) {
    RawCatalog catalog;
    for (int i = 0; i < 40; ++i) {
        catalog.push_back({ "raw_" + std::to_string(i) + ".jpg", ImageFingerprint{ 0x9E3779B97F4A7C15ULL * (i + 1) } });
    }

    std::vector<FingerprintResult> edited;
    for (int i = 0; i < 97; ++i) {
        if (i % 11 == 0) {
            edited.push_back(failed("edit_" + std::to_string(i) + ".jpg", "unreadable"));
            continue;
        }
        const auto base = catalog[static_cast<size_t>(i) % catalog.size()].fingerprint.bits;
        edited.push_back(computed("edit_" + std::to_string(i) + ".jpg", ImageFingerprint{ base ^ (uint64_t{ 1 } << (i % 64)) ^ (i % 3 == 0 ? 0xFFULL : 0) }));
    }

    const auto sequential = matchAll(edited, catalog, 3, 1);
    for (int workers : { 2, 5, 0 }) {
        const auto parallel = matchAll(edited, catalog, 3, workers);
        ASSERT_EQ(parallel.size(), sequential.size());
        for (size_t i = 0; i < sequential.size(); ++i) {
            EXPECT_EQ(parallel[i].editedPath, sequential[i].editedPath);
            EXPECT_EQ(parallel[i].status, sequential[i].status);
            EXPECT_EQ(parallel[i].matchedRawPath, sequential[i].matchedRawPath);
            EXPECT_EQ(parallel[i].distance, sequential[i].distance);
        }
    }
}

TEST(MatcherTests, MatchAllWithoutEditsIsEmpty) {
    EXPECT_TRUE(matchAll({}, opposites(), 3, 4).empty());
}
