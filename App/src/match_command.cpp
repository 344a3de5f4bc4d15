#include "match_command.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include "placement.hpp"
#include "save_results.hpp"

#include <rang.hpp>

#include <chrono>
#include <iostream>
#include <unordered_set>

namespace fs = std::filesystem;
using namespace rang;
using namespace snapmatch_app;

namespace {

// Canonical paths of every file seen this run; cache entries for anything else are stale
std::unordered_set<std::string> livePaths(const std::vector<std::string>& raw, const std::vector<std::string>& edited)
{
    std::unordered_set<std::string> live;
    for (const auto* paths : { &raw, &edited }) {
        for (const auto& p : *paths) {
            if (auto identity = snapmatch::FileIdentity::of(p)) live.insert(identity->path);
        }
    }
    return live;
}

// Destination of each matched raw file, empty for unmatched decisions or failed placements
std::vector<std::string> placeMatches(const Arguments& args, const std::vector<snapmatch::MatchDecision>& decisions)
{
    std::vector<std::string> copiedTo(decisions.size());
    PlacementPlanner planner(args.outDirectory, args.rawDirectory, args.preserveRawSubdirs);
    size_t failures = 0;

    for (size_t i = 0; i < decisions.size(); ++i) {
        const auto& d = decisions[i];
        if (d.status != snapmatch::MatchStatus::Matched || !d.matchedRawPath) continue;

        const fs::path dst = planner.destinationFor(*d.matchedRawPath);

        if (!args.dryRun) {
            try {
                placeFile(*d.matchedRawPath, dst, args.mode);
            }
            catch (const fs::filesystem_error& e) {
                SNAPMATCH_ERROR("placement", *d.matchedRawPath, " -> ", dst.string(), ": ", e.what());
                std::cerr << fg::red << "Error placing '" << *d.matchedRawPath << "': " << e.what() << fg::reset << '\n';
                ++failures;
                continue;
            }
        }

        copiedTo[i] = dst.string();
    }

    if (failures > 0) {
        std::cout << fg::yellow << "Warning: " << withCommas(failures) << " matched file(s) could not be placed" << fg::reset << '\n';
    }

    return copiedTo;
}

} // namespace

int snapmatch_app::handleMatchCommand(const Arguments& args)
{
    try {
        fs::create_directories(args.outDirectory);

        const auto rawPaths = collectImagePaths(args.rawDirectory, args.extensions, args.recursive);
        const auto editedPaths = collectImagePaths(args.editedDirectory, args.extensions, args.recursive);

        auto start = std::chrono::high_resolution_clock::now();

        printConfiguration(args, rawPaths.size(), editedPaths.size());

        if (args.dryRun) {
            std::cout << "(DRY RUN - no files will be copied or linked)\n\n";
        }

        snapmatch::FingerprintCache cache(args.cachePath);
        const bool useCache = !args.cachePath.empty();
        if (useCache) cache.load();
        snapmatch::FingerprintCache* cachePtr = useCache ? &cache : nullptr;

        snapmatch::OpenCvDecoder decoder;
        const auto rawResults = fingerprintWithProgress("Raw", rawPaths, decoder, cachePtr, args.workers);
        const auto editedResults = fingerprintWithProgress("Edited", editedPaths, decoder, cachePtr, args.workers);

        const auto catalog = snapmatch::buildCatalog(rawResults);
        if (catalog.empty()) {
            SNAPMATCH_WARN("match", "no readable raw image in ", args.rawDirectory.string());
            std::cout << fg::yellow << "Warning: no readable raw images found, nothing can be matched" << fg::reset << '\n';
        }

        const auto decisions = snapmatch::matchAll(editedResults, catalog, args.maxDistance, args.workers);

        if (useCache) {
            const size_t pruned = cache.prune(livePaths(rawPaths, editedPaths));
            SNAPMATCH_DEBUG("match", "pruned ", pruned, " stale cache entries");
            if (!cache.persist()) {
                std::cout << fg::yellow << "Warning: fingerprint cache could not be saved to "
                          << args.cachePath.string() << fg::reset << '\n';
            }
        }

        const auto copiedTo = placeMatches(args, decisions);

        const fs::path reportPath = args.reportPath();
        if (!saveMappingCSV(reportPath.string(), decisions, copiedTo)) {
            return 1;
        }

        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        std::cout << fg::green << "\nCompleted " << withCommas(decisions.size()) << " edited images in "
                  << duration.count() / 1000.0 << " seconds\n\n" << fg::reset;

        printMatchResults(decisions, copiedTo, reportPath);
    }
    catch (const std::exception& e) {
        SNAPMATCH_ERROR("match", e.what());
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
