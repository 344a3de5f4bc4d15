//
// matcher.hpp
// Nearest raw fingerprint for each edited image
//

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "coordinator.hpp"
#include "fingerprint.hpp"

namespace snapmatch {

constexpr int kDefaultMaxDistance = 3;

enum class MatchStatus {
    Matched,
    NoMatch,
    Error
};

// "matched", "no_match", "error"
std::string_view toString(MatchStatus status);

struct CatalogEntry {
    std::string path;
    ImageFingerprint fingerprint;
};

// Raw collection in scan order. Read-only once built.
using RawCatalog = std::vector<CatalogEntry>;

/**
 * One decision per edited image. matchedRawPath and distance are only set
 * when status is Matched; error is only set when status is Error.
 */
struct MatchDecision {
    std::string editedPath;
    std::optional<std::string> matchedRawPath;
    std::optional<int> distance;
    MatchStatus status = MatchStatus::NoMatch;
    std::string error;
};

/**
 * Keep the successfully fingerprinted raw files, in order. Failed files are
 * left out with a warning.
 */
RawCatalog buildCatalog(const std::vector<FingerprintResult>& raw);

/**
 * Brute-force nearest neighbour under Hamming distance.
 *
 * Of several entries at the minimum distance the earliest in catalog order
 * wins. A minimum above maxDistance is rejected as NoMatch, as is an empty
 * catalog.
 *
 * @throws ConfigurationError if maxDistance is negative
 */
MatchDecision findBest(const std::string& editedPath,
                       ImageFingerprint edited,
                       const RawCatalog& catalog,
                       int maxDistance);

/**
 * Decide every edited result. Output order equals input order for any
 * workerCount; Failed inputs become Error decisions.
 *
 * @param workerCount 0 = auto, 1 = sequential
 * @throws ConfigurationError if maxDistance or workerCount is negative
 */
std::vector<MatchDecision> matchAll(const std::vector<FingerprintResult>& edited,
                                    const RawCatalog& catalog,
                                    int maxDistance,
                                    int workerCount = 1);

} // namespace snapmatch
