#include "hash_command.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include "save_results.hpp"

#include <rang.hpp>

#include <algorithm>
#include <chrono>
#include <iostream>

namespace fs = std::filesystem;
using namespace rang;
using namespace snapmatch_app;

int snapmatch_app::handleHashCommand(const Arguments& args)
{
    try {
        const auto filePaths = collectImagePaths(args.directory, args.extensions, args.recursive);

        auto start = std::chrono::high_resolution_clock::now();

        printConfiguration(args, filePaths.size());

        snapmatch::FingerprintCache cache(args.cachePath);
        const bool useCache = !args.cachePath.empty();
        if (useCache) cache.load();

        snapmatch::OpenCvDecoder decoder;
        const auto results = fingerprintWithProgress("Images", filePaths, decoder, useCache ? &cache : nullptr, args.workers);

        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        const auto failedCount = static_cast<size_t>(std::ranges::count_if(results, [](const auto& r) { return !r.ok(); }));
        const auto cachedCount = static_cast<size_t>(std::ranges::count(results, snapmatch::FingerprintStatus::Cached,
                                                                        &snapmatch::FingerprintResult::status));

        std::cout << fg::green << "\nCompleted " << withCommas(results.size() - failedCount) << " images in "
                  << duration.count() / 1000.0 << " seconds";
        if (cachedCount > 0) std::cout << " (" << withCommas(cachedCount) << " from cache)";
        std::cout << "\n\n" << fg::reset;

        if (failedCount > 0) {
            std::cout << fg::yellow << "Warning: " << withCommas(failedCount) << " image(s) failed to process" << fg::reset << "\n";
        }

        if (!args.outputPath.empty()) {
            saveHashesCSV(args.outputPath, results);
        }

        printHashResults(results, args.outputPath);

        if (useCache && !cache.persist()) {
            std::cout << fg::yellow << "Warning: fingerprint cache could not be saved to "
                      << args.cachePath.string() << fg::reset << '\n';
        }
    }
    catch (const std::exception& e) {
        SNAPMATCH_ERROR("hash", e.what());
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
