#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "placement.hpp"

namespace snapmatch_app {

namespace defaults {
    constexpr const char* DEFAULT_EXTENSIONS = "jpg,jpeg,png,bmp,tiff,tif,webp,jfif";
    constexpr const char* DEFAULT_OUTPUT = "";
    constexpr const char* DEFAULT_CACHE = "";
    constexpr const char* DEFAULT_MODE = "copy";
    constexpr const char* CACHE_FILENAME = "snapmatch_cache.csv";
    constexpr const char* REPORT_FILENAME = "mapping.csv";

    constexpr int MAX_DISTANCE = 3;
    constexpr int WORKERS = 0;
    constexpr int LOG_LEVEL = 4;
    constexpr bool NO_RECURSIVE = false;
    constexpr bool NO_CACHE = false;
    constexpr bool PRESERVE_RAW_SUBDIRS = false;
    constexpr bool DRY_RUN = false;
}

// Values exactly as parsed from the command line, before validation
struct RawArguments {
    std::string rawDirectory;
    std::string editedDirectory;
    std::string outDirectory;
    std::string directory;

    std::string extensions = defaults::DEFAULT_EXTENSIONS;
    bool noRecursive = defaults::NO_RECURSIVE;
    int maxDistance = defaults::MAX_DISTANCE;
    int workers = defaults::WORKERS;
    std::string mode = defaults::DEFAULT_MODE;
    std::string cachePath = defaults::DEFAULT_CACHE;
    bool noCache = defaults::NO_CACHE;
    bool preserveRawSubdirs = defaults::PRESERVE_RAW_SUBDIRS;
    bool dryRun = defaults::DRY_RUN;
    int logLevel = defaults::LOG_LEVEL;
    std::string outputPath = defaults::DEFAULT_OUTPUT;
};

/**
 * Validated configuration. Construction throws snapmatch::ConfigurationError
 * (a std::invalid_argument) for anything unusable, before any work starts.
 */
class Arguments {
public:
    enum class Command { Match, Hash };

    Arguments(const RawArguments& raw, Command command);

    const Command command;

    // match
    const std::filesystem::path rawDirectory;
    const std::filesystem::path editedDirectory;
    const std::filesystem::path outDirectory;
    // hash
    const std::filesystem::path directory;

    const std::vector<std::string> extensions;
    const bool recursive;
    const int maxDistance;
    const int workers;
    const PlacementMode mode;
    // Empty when caching is disabled
    const std::filesystem::path cachePath;
    const bool preserveRawSubdirs;
    const bool dryRun;
    const int logLevel;
    const std::string outputPath;

    std::filesystem::path reportPath() const { return outDirectory / defaults::REPORT_FILENAME; }
};

} // namespace snapmatch_app
