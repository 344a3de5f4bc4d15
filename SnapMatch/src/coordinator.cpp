#include "../include/coordinator.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"
#include "work_queue.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <thread>

namespace snapmatch {

namespace {

// Queued jobs per worker so nobody starves while the producer refills
constexpr size_t kPrefetchFactor = 8;

} // namespace

unsigned resolveWorkerCount(int requested, unsigned hardwareThreads, size_t jobs)
{
    if (requested < 0) {
        throw ConfigurationError(std::format("worker count must be 0 (auto) or positive (received {})", requested));
    }

    size_t workers = requested == 0 ? std::max(1u, hardwareThreads) : static_cast<size_t>(requested);
    workers = std::min(workers, std::max<size_t>(1, jobs));
    return static_cast<unsigned>(workers);
}

FingerprintCoordinator::FingerprintCoordinator(const ImageDecoder& decoder,
                                               FingerprintCache* cache,
                                               ProgressTracker::ProgressCallback callback)
    : m_decoder(decoder), m_cache(cache), m_callback(std::move(callback))
{
}

void FingerprintCoordinator::processOne(const std::string& path, Job& job, ProgressTracker& progress) const
{
    job.result.path = path;

    try {
        if (m_cache) {
            job.identity = FileIdentity::of(path);
            progress.update(PipelineStage::Lookup, 1);

            if (job.identity) {
                if (auto cached = m_cache->lookup(*job.identity)) {
                    job.result.status = FingerprintStatus::Cached;
                    job.result.fingerprint = *cached;
                    progress.update(PipelineStage::Cached, 1);
                    return;
                }
            }
        }

        GrayImage image = m_decoder.decode(path);
        progress.update(PipelineStage::Decode, 1);

        job.result.fingerprint = computeFingerprint(image);
        job.result.status = FingerprintStatus::Computed;
        progress.update(PipelineStage::Hash, 1);
    }
    catch (const DecodeError& e) {
        job.result.status = FingerprintStatus::Failed;
        job.result.fingerprint.reset();
        job.result.error = e.what();
        progress.updateFailed(1);
    }
    catch (const std::exception& e) {
        job.result.status = FingerprintStatus::Failed;
        job.result.fingerprint.reset();
        job.result.error = std::string("unexpected failure: ") + e.what();
        progress.updateFailed(1);
    }
}

std::vector<FingerprintResult> FingerprintCoordinator::fingerprintAll(const std::vector<std::string>& files, int workerCount)
{
    const unsigned workers = resolveWorkerCount(workerCount, std::thread::hardware_concurrency(), files.size());

    ProgressTracker progress(files.size(), m_callback);
    std::vector<Job> jobs(files.size());

    auto start = std::chrono::steady_clock::now();
    SNAPMATCH_INFO("coordinator", "fingerprinting ", files.size(), " file(s) with ", workers, " worker(s)");

    if (workers <= 1 || files.size() <= 1) {
        for (size_t i = 0; i < files.size(); ++i) {
            processOne(files[i], jobs[i], progress);
        }
    }
    else {
        WorkQueue<size_t> queue(workers * kPrefetchFactor, "fingerprint");

        // Each worker writes only the slot of the index it popped
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (unsigned w = 0; w < workers; ++w) {
            pool.emplace_back([this, &queue, &files, &jobs, &progress] {
                while (auto index = queue.pop()) {
                    processOne(files[*index], jobs[*index], progress);
                }
            });
        }

        for (size_t i = 0; i < files.size(); ++i) {
            queue.push(i);
        }
        queue.setSentinel();

        for (auto& t : pool) t.join();
    }

    progress.forceUpdate();

    std::vector<FingerprintResult> results;
    results.reserve(jobs.size());
    size_t stored = 0;

    for (Job& job : jobs) {
        if (m_cache && job.identity && job.result.status == FingerprintStatus::Computed) {
            m_cache->store(*job.identity, *job.result.fingerprint, kAlgorithmVersion);
            ++stored;
        }
        if (!job.result.ok()) {
            SNAPMATCH_DEBUG("coordinator", job.result.path, ": ", job.result.error);
        }
        results.push_back(std::move(job.result));
    }

    const auto info = progress.getProgress();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    SNAPMATCH_INFO("coordinator", "done in ", elapsed.count(), " ms: ", info.hashedCompleted, " computed, ",
                   info.cacheHits, " cached, ", info.failedImages, " failed, ", stored, " new cache entries");

    return results;
}

} // namespace snapmatch
