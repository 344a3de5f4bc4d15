//
// coordinator.hpp
// Parallel fingerprinting of a file list with cache assistance
//

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "fingerprint.hpp"
#include "fingerprint_cache.hpp"
#include "image_decoder.hpp"
#include "progress_tracker.hpp"

namespace snapmatch {

enum class FingerprintStatus {
    Computed,
    Cached,
    Failed
};

/**
 * Outcome for one input file. fingerprint is set unless status is Failed,
 * in which case error carries the reason.
 */
struct FingerprintResult {
    std::string path;
    FingerprintStatus status = FingerprintStatus::Failed;
    std::optional<ImageFingerprint> fingerprint;
    std::string error;

    bool ok() const { return status != FingerprintStatus::Failed; }
};

/**
 * Worker-count policy.
 * @param requested      0 = auto, otherwise the exact count (must be >= 0)
 * @param hardwareThreads value of std::thread::hardware_concurrency(), 0 if unknown
 * @param jobs           number of files; the result never exceeds it (floor 1)
 * @throws ConfigurationError if requested is negative
 */
unsigned resolveWorkerCount(int requested, unsigned hardwareThreads, size_t jobs);

class FingerprintCoordinator {
public:
    /**
     * @param decoder  shared by all workers, must be thread-safe
     * @param cache    optional; read by workers, written only by this coordinator after they finish
     * @param callback progress callback, invoked from worker threads
     */
    FingerprintCoordinator(const ImageDecoder& decoder,
                           FingerprintCache* cache = nullptr,
                           ProgressTracker::ProgressCallback callback = nullptr);

    /**
     * Fingerprint every file. Results are in input order and identical for any worker count.
     * A failure on one file is recorded in its own result and never affects the others.
     * @param workerCount 0 = auto, 1 = sequential on the calling thread
     * @throws ConfigurationError if workerCount is negative
     */
    std::vector<FingerprintResult> fingerprintAll(const std::vector<std::string>& files, int workerCount);

private:
    struct Job {
        FingerprintResult result;
        std::optional<FileIdentity> identity;
    };

    void processOne(const std::string& path, Job& job, ProgressTracker& progress) const;

    const ImageDecoder& m_decoder;
    FingerprintCache* m_cache;
    ProgressTracker::ProgressCallback m_callback;
};

} // namespace snapmatch
