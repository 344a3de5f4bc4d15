//
// fingerprint_cache.hpp
// Persistent FileIdentity -> fingerprint map, used to skip decoding unchanged files
//

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "fingerprint.hpp"

namespace snapmatch {

/**
 * Cache key. A change in any component makes the cached fingerprint stale.
 */
struct FileIdentity {
    std::string path;
    std::uintmax_t size = 0;
    int64_t mtimeNs = 0;

    bool operator==(const FileIdentity&) const = default;

    /**
     * Stat a file and build its identity with a canonicalized path.
     * @return nullopt if the file is missing or cannot be stat'ed
     */
    static std::optional<FileIdentity> of(const std::filesystem::path& file);
};

struct CacheEntry {
    FileIdentity identity;
    int algorithmVersion = kAlgorithmVersion;
    ImageFingerprint fingerprint;

    bool operator==(const CacheEntry&) const = default;
};

/**
 * The cache is advisory: a missing, unreadable or corrupt medium behaves like an
 * empty cache and a failed write only loses persistence, never the run.
 *
 * lookup() is const and may be called from many threads at once. store(),
 * prune() and load() must only run while no lookup is in flight; the
 * FingerprintCoordinator is the single writer.
 *
 * On-disk format is CSV: path,size,mtime_ns,algorithm_version,fingerprint
 */
class FingerprintCache {
public:
    explicit FingerprintCache(std::filesystem::path storagePath = {}, int algorithmVersion = kAlgorithmVersion);

    // Hit only for an identical identity stored by the current algorithm version
    std::optional<ImageFingerprint> lookup(const FileIdentity& identity) const;

    void store(const FileIdentity& identity, ImageFingerprint fingerprint, int algorithmVersion);

    // Drop entries whose path is not in livePaths; returns the number removed
    size_t prune(const std::unordered_set<std::string>& livePaths);

    // Replace in-memory entries with the storage file. Returns false (and leaves the cache empty)
    // if the file exists but cannot be read or has an unexpected header.
    bool load();

    // Write all entries atomically (temporary file + rename). Returns false on failure.
    bool persist() const;

    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    // Snapshot sorted by path
    std::vector<CacheEntry> entries() const;

    const std::filesystem::path& storagePath() const { return m_storagePath; }
    int algorithmVersion() const { return m_algorithmVersion; }

private:
    std::filesystem::path m_storagePath;
    int m_algorithmVersion;
    std::unordered_map<std::string, CacheEntry> m_entries;
};

} // namespace snapmatch
