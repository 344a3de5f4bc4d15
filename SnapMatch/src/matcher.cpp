#include "../include/matcher.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"

#include <algorithm>
#include <format>
#include <thread>

namespace snapmatch {

namespace {

void validateMaxDistance(int maxDistance)
{
    if (maxDistance < 0) {
        throw ConfigurationError(std::format("max distance must be non-negative (received {})", maxDistance));
    }
}

MatchDecision decide(const FingerprintResult& edited, const RawCatalog& catalog, int maxDistance)
{
    if (!edited.ok()) {
        MatchDecision decision;
        decision.editedPath = edited.path;
        decision.status = MatchStatus::Error;
        decision.error = edited.error;
        return decision;
    }
    return findBest(edited.path, *edited.fingerprint, catalog, maxDistance);
}

} // namespace

std::string_view toString(MatchStatus status)
{
    switch (status) {
        case MatchStatus::Matched: return "matched";
        case MatchStatus::NoMatch: return "no_match";
        case MatchStatus::Error: return "error";
    }
    return "unknown";
}

RawCatalog buildCatalog(const std::vector<FingerprintResult>& raw)
{
    RawCatalog catalog;
    catalog.reserve(raw.size());

    for (const auto& result : raw) {
        if (!result.ok()) {
            SNAPMATCH_WARN("catalog", "skipping raw image ", result.path, ": ", result.error);
            continue;
        }
        catalog.push_back({ result.path, *result.fingerprint });
    }
    return catalog;
}

MatchDecision findBest(const std::string& editedPath,
                       ImageFingerprint edited,
                       const RawCatalog& catalog,
                       int maxDistance)
{
    validateMaxDistance(maxDistance);

    MatchDecision decision;
    decision.editedPath = editedPath;
    decision.status = MatchStatus::NoMatch;

    const CatalogEntry* best = nullptr;
    int bestDistance = kFingerprintBits + 1;

    // Strict < keeps the earliest entry among equal distances
    for (const auto& candidate : catalog) {
        const int d = hammingDistance(edited, candidate.fingerprint);
        if (d < bestDistance) {
            bestDistance = d;
            best = &candidate;
            if (d == 0) break;
        }
    }

    if (best && bestDistance <= maxDistance) {
        decision.status = MatchStatus::Matched;
        decision.matchedRawPath = best->path;
        decision.distance = bestDistance;
    }
    else if (best) {
        SNAPMATCH_DEBUG("matcher", editedPath, ": nearest raw is ", best->path, " at distance ", bestDistance,
                        ", above limit ", maxDistance);
    }

    return decision;
}

std::vector<MatchDecision> matchAll(const std::vector<FingerprintResult>& edited,
                                    const RawCatalog& catalog,
                                    int maxDistance,
                                    int workerCount)
{
    validateMaxDistance(maxDistance);
    const unsigned workers = resolveWorkerCount(workerCount, std::thread::hardware_concurrency(), edited.size());

    std::vector<MatchDecision> decisions(edited.size());

    if (workers <= 1) {
        for (size_t i = 0; i < edited.size(); ++i) {
            decisions[i] = decide(edited[i], catalog, maxDistance);
        }
        return decisions;
    }

    // Contiguous slices; each thread fills only its own range
    const size_t chunk = (edited.size() + workers - 1) / workers;
    std::vector<std::thread> pool;
    pool.reserve(workers);

    for (size_t begin = 0; begin < edited.size(); begin += chunk) {
        const size_t end = std::min(edited.size(), begin + chunk);
        pool.emplace_back([&, begin, end] {
            for (size_t i = begin; i < end; ++i) {
                decisions[i] = decide(edited[i], catalog, maxDistance);
            }
        });
    }

    for (auto& t : pool) t.join();
    return decisions;
}

} // namespace snapmatch
