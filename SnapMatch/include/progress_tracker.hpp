#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>

namespace snapmatch {

enum class PipelineStage {
    All,
    Lookup,
    Cached,
    Decode,
    Hash
};

struct ProgressInfo {
    size_t totalImages = 0;
    size_t lookupsCompleted = 0;
    size_t cacheHits = 0;
    size_t decodedCompleted = 0;
    size_t hashedCompleted = 0;
    size_t failedImages = 0;

    // Files with a final outcome: fingerprinted, reused from cache or failed
    size_t finished() const { return hashedCompleted + cacheHits + failedImages; }

    float overallProgress() const {
        if (totalImages == 0) return 0.0f;
        return static_cast<float>(finished()) / totalImages;
    }

    // Cache hits count as done for the decode and hash stages since they skip both.
    size_t percentComplete(PipelineStage stage) const {
        if (totalImages == 0) return 0;

        auto pct = [this](size_t n) {
            return static_cast<size_t>((static_cast<float>(n) / totalImages) * 100);
        };

        switch (stage) {
            case PipelineStage::Lookup:
                return pct(lookupsCompleted);
            case PipelineStage::Cached:
                return pct(cacheHits);
            case PipelineStage::Decode:
                return pct(decodedCompleted + cacheHits);
            case PipelineStage::Hash:
                return pct(hashedCompleted + cacheHits);
            default:
                return static_cast<size_t>(overallProgress() * 100);
        }
    }
};

// Thread-safe progress tracker with rate-limited callbacks
class ProgressTracker {
public:
    using ProgressCallback = std::function<void(const ProgressInfo&)>;

    ProgressTracker(size_t totalImages, ProgressCallback callback = nullptr,
                    std::chrono::milliseconds minCallbackInterval = std::chrono::milliseconds(500));

    void update(PipelineStage stage, size_t count);
    void updateFailed(size_t count);
    void forceUpdate();

    ProgressInfo getProgress() const;

private:
    std::atomic<size_t> m_totalImages;
    std::atomic<size_t> m_lookupsCompleted;
    std::atomic<size_t> m_cacheHits;
    std::atomic<size_t> m_decodedCompleted;
    std::atomic<size_t> m_hashedCompleted;
    std::atomic<size_t> m_failedImages;

    ProgressCallback m_callback;
    mutable std::mutex m_callbackMutex;
    std::chrono::steady_clock::time_point m_lastCallbackTime;
    const std::chrono::milliseconds m_minCallbackInterval;

    void tryInvokeCallback();
};

} // namespace snapmatch
