#include "arguments.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <concepts>
#include <format>
#include <ranges>
#include <string_view>
#include <unordered_set>

namespace snapmatch_app {

namespace fs = std::filesystem;
using snapmatch::ConfigurationError;

namespace {

std::string trimCopy(std::string_view value)
{
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return {};

    const auto end = value.find_last_not_of(" \t\r\n");
    return std::string(value.substr(start, end - start + 1));
}

std::string toLowerCopy(std::string value)
{
    std::ranges::transform(value,
                           value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::vector<std::string> parseExtensionList(const std::string& exts)
{
    std::vector<std::string> extensions;
    std::unordered_set<std::string> seen;

    if (exts.empty()) return extensions;

    std::string_view sv = exts;
    size_t start = 0;

    while (start < sv.size()) {
        const auto pos = sv.find_first_of(",;", start);
        const auto token = sv.substr(start, pos == std::string_view::npos ? sv.size() - start : pos - start);
        auto cleaned = trimCopy(token);

        if (!cleaned.empty() && cleaned.front() == '.') {
            cleaned.erase(0, 1);
        }

        cleaned = toLowerCopy(std::move(cleaned));
        if (!cleaned.empty() && seen.insert(cleaned).second) {
            extensions.emplace_back(std::move(cleaned));
        }

        if (pos == std::string_view::npos) break;

        start = pos + 1;
    }

    return extensions;
}

template<std::integral T>
T validateInRange(std::string_view flag, T value, T min, T max)
{
    if (value < min || value > max) {
        throw ConfigurationError(std::format("{} must be between {} and {} (received {}).", flag, min, max, value));
    }
    return value;
}

fs::path validateDirectory(std::string_view flag, const fs::path& input)
{
    if (input.empty()) {
        throw ConfigurationError(std::format("A directory must be provided ({}).", flag));
    }

    std::error_code ec;
    if (!fs::exists(input, ec)) {
        throw ConfigurationError("Directory '" + input.string() + "' does not exist.");
    }

    if (!fs::is_directory(input, ec)) {
        throw ConfigurationError("Path '" + input.string() + "' is not a directory.");
    }

    const auto absolutePath = fs::weakly_canonical(input, ec);
    if (ec) {
        throw ConfigurationError("Unable to resolve directory '" + input.string() + "': " + ec.message());
    }

    return absolutePath;
}

// The output folder may not exist yet; it is created by the match command.
fs::path validateOutDirectory(const fs::path& input)
{
    if (input.empty()) {
        throw ConfigurationError("An output directory must be provided (--out).");
    }

    std::error_code ec;
    if (fs::exists(input, ec) && !fs::is_directory(input, ec)) {
        throw ConfigurationError("Output path '" + input.string() + "' exists and is not a directory.");
    }

    const auto absolutePath = fs::weakly_canonical(input, ec);
    if (ec) {
        throw ConfigurationError("Unable to resolve output directory '" + input.string() + "': " + ec.message());
    }

    return absolutePath;
}

int validateWorkers(int value)
{
    if (value >= 0) return value;

    throw ConfigurationError(
        std::format("--workers must be 0 (auto) or greater than zero (received {}).", value));
}

PlacementMode validateMode(const std::string& value)
{
    if (auto mode = parsePlacementMode(value)) return *mode;

    throw ConfigurationError("--mode must be one of copy, hardlink, symlink (received '" + value + "').");
}

fs::path resolveCachePath(const RawArguments& raw, Arguments::Command command, const fs::path& outDirectory)
{
    if (raw.noCache) return {};

    if (!raw.cachePath.empty()) {
        std::error_code ec;
        const auto resolved = fs::weakly_canonical(raw.cachePath, ec);
        if (ec) {
            throw ConfigurationError("Unable to resolve cache path '" + raw.cachePath + "': " + ec.message());
        }
        if (fs::is_directory(resolved, ec)) {
            throw ConfigurationError("Cache path '" + raw.cachePath + "' is a directory.");
        }
        return resolved;
    }

    // hash has no output folder, so it only caches when asked to
    if (command == Arguments::Command::Match) return outDirectory / defaults::CACHE_FILENAME;
    return {};
}

} // namespace

Arguments::Arguments(const RawArguments& raw, Command command)
    : command(command),
      rawDirectory(command == Command::Match ? validateDirectory("--raw", raw.rawDirectory) : fs::path{}),
      editedDirectory(command == Command::Match ? validateDirectory("--edited", raw.editedDirectory) : fs::path{}),
      outDirectory(command == Command::Match ? validateOutDirectory(raw.outDirectory) : fs::path{}),
      directory(command == Command::Hash ? validateDirectory("--directory", raw.directory) : fs::path{}),
      extensions(parseExtensionList(raw.extensions)),
      recursive(!raw.noRecursive),
      maxDistance(validateInRange("--max-distance", raw.maxDistance, 0, 64)),
      workers(validateWorkers(raw.workers)),
      mode(validateMode(raw.mode)),
      cachePath(resolveCachePath(raw, command, outDirectory)),
      preserveRawSubdirs(raw.preserveRawSubdirs),
      dryRun(raw.dryRun),
      logLevel(validateInRange("--log-level", raw.logLevel, 1, 4)),
      outputPath(raw.outputPath)
{
}

} // namespace snapmatch_app
