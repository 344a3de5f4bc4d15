//
// helpers.cpp
// General utility and helper functions for the SnapMatch CLI application
//

#include "helpers.hpp"
#include "arguments.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ranges>
#include <unordered_set>

#include <indicators/multi_progress.hpp>
#include <rang.hpp>
#include <tabulate/table.hpp>

namespace snapmatch_app {

namespace fs = std::filesystem;
using namespace rang;
using namespace tabulate;

std::string centerText(std::string_view text, int width) {
    if (text.length() >= static_cast<size_t>(width)) return std::string(text);
    int leftPadding = (width - static_cast<int>(text.length())) / 2;
    return std::string(leftPadding, ' ') + std::string(text);
}

indicators::ProgressBar bar(std::string_view prefix, bool show_elapsed, bool show_remaining) {
    return indicators::ProgressBar{
        indicators::option::BarWidth{30},
        indicators::option::PrefixText{std::string(prefix)},
        indicators::option::Start{"["},
        indicators::option::Fill{"="},
        indicators::option::Lead{">"},
        indicators::option::Remainder{" "},
        indicators::option::End{"]"},
        indicators::option::ShowPercentage{true},
        indicators::option::ShowElapsedTime{show_elapsed},
        indicators::option::ShowRemainingTime{show_remaining},
        indicators::option::Stream{std::cout}
    };
}

std::string toLower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::vector<std::string> collectImagePaths(const fs::path& dir,
    const std::vector<std::string>& allowedExtensions,
    bool recursive)
{
    const std::unordered_set<std::string> exts(allowedExtensions.begin(), allowedExtensions.end());

    auto normalizeExt = [](const fs::path& p) {
        std::string ext = toLower(p.extension().string());
        return ext.starts_with('.') ? ext.substr(1) : ext;
        };

    auto shouldInclude = [&](const auto& entry) {
        return entry.is_regular_file() && (exts.empty() || exts.contains(normalizeExt(entry.path())));
        };

    std::vector<std::string> files;
    constexpr auto opts = fs::directory_options::skip_permission_denied;

    try {
        auto processDir = [&](auto&& iterator) {
            for (const auto& entry : iterator) {
                if (shouldInclude(entry)) files.emplace_back(entry.path().string());
            }
        };

        recursive ? processDir(fs::recursive_directory_iterator(dir, opts))
            : processDir(fs::directory_iterator(dir, opts));
    }
    catch (const fs::filesystem_error& e) {
        throw std::runtime_error(std::format("Error scanning directory: {}", e.what()));
    }

    std::ranges::sort(files);

    if (files.empty()) {
        throw std::runtime_error(std::format("No images found in directory '{}'", dir.string()));
    }

    return files;
}

std::string formatFileSize(std::uintmax_t bytes)
{
    const char* units[] = { "B", "KB", "MB", "GB", "TB" };

    int unit = 0;
    double size = static_cast<double>(bytes);
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        ++unit;
    }

    return std::format("{:.2f} {}", size, units[unit]);
}

std::vector<snapmatch::FingerprintResult> fingerprintWithProgress(std::string_view label,
                                                                  const std::vector<std::string>& paths,
                                                                  const snapmatch::ImageDecoder& decoder,
                                                                  snapmatch::FingerprintCache* cache,
                                                                  int workers)
{
    using snapmatch::PipelineStage;

    std::cout << fg::cyan << label << fg::reset << " (" << withCommas(paths.size()) << " images)\n";
    hideCursor();

    std::array<indicators::ProgressBar, 3> bar_arr = {
        bar("Total  ", true, true),
        bar("Decode "),
        bar("Hash   ")
    };
    indicators::MultiProgress<indicators::ProgressBar, 3> bars(bar_arr[0], bar_arr[1], bar_arr[2]);

    auto progressCallback = [&bars, &bar_arr](const snapmatch::ProgressInfo& info) {
        bars.set_progress<0>(info.percentComplete(PipelineStage::All));
        bars.set_progress<1>(info.percentComplete(PipelineStage::Decode));
        bars.set_progress<2>(info.percentComplete(PipelineStage::Hash));

        if (info.failedImages > 0) {
            bar_arr[0].set_option(indicators::option::ForegroundColor{indicators::Color::yellow});
            bar_arr[0].set_option(indicators::option::PostfixText{ "(" + std::to_string(info.failedImages) + " failed image(s))" });
        }
    };

    snapmatch::FingerprintCoordinator coordinator(decoder, cache, progressCallback);

    std::vector<snapmatch::FingerprintResult> results;
    try {
        results = coordinator.fingerprintAll(paths, workers);
    }
    catch (const std::exception&) {
        showCursor();
        throw;
    }

    showCursor();
    std::cout << '\n';
    return results;
}

void printConfiguration(const Arguments& args, size_t firstCount, size_t secondCount)
{
    constexpr int colWidth = 16;
    constexpr int tableWidth = (colWidth * 4) + 5;

    const std::string workersStr = args.workers == 0 ? "auto" : std::to_string(args.workers);
    const std::string cacheStr = args.cachePath.empty() ? "off" : args.cachePath.filename().string();

    Table configurations;

    if (args.command == Arguments::Command::Match) {
        std::cout << style::italic
            << centerText(args.rawDirectory.string(), tableWidth) << '\n'
            << centerText(args.editedDirectory.string(), tableWidth) << '\n'
            << centerText(withCommas(firstCount) + " raw / " + withCommas(secondCount) + " edited images", tableWidth)
            << style::reset << '\n';

        configurations.add_row({ "Max Distance", "Workers", "Placement", "Cache" });
        configurations.add_row({ std::to_string(args.maxDistance), workersStr,
                                 std::string(toString(args.mode)) + (args.dryRun ? " (dry run)" : ""), cacheStr });
    }
    else {
        std::cout << style::italic
            << centerText(args.directory.string(), tableWidth) << '\n'
            << centerText(withCommas(firstCount) + " images", tableWidth)
            << style::reset << '\n';

        configurations.add_row({ "Fingerprint", "Grid", "Workers", "Cache" });
        configurations.add_row({ "dHash (64 bits)",
                                 std::to_string(snapmatch::kGridWidth) + "x" + std::to_string(snapmatch::kGridHeight),
                                 workersStr, cacheStr });
    }

    configurations.format().width(colWidth).font_align(FontAlign::center);
    configurations[0].format().font_style({ FontStyle::bold });

    std::cout << configurations << std::endl << std::endl;
}

void printHashResults(const std::vector<snapmatch::FingerprintResult>& results, const std::string& outputPath)
{
    constexpr int tableWidth = (4 * 16) + 2;
    constexpr int colWidth = tableWidth / 2;

    std::cout << style::italic << centerText("Results", tableWidth) << style::reset << '\n';

    Table table;
    table.add_row({ "File", "dHash (Hex)" });

    for (size_t i : std::views::iota(size_t{ 0 }, std::min<size_t>(5, results.size()))) {
        const auto& r = results[i];
        table.add_row({ fs::path(r.path).filename().string(), r.ok() ? r.fingerprint->to_string() : "unreadable" });
    }

    table.format().width(colWidth).font_align(FontAlign::center);
    table[0].format().font_style({ FontStyle::bold });

    std::cout << table << '\n';

    if (results.size() > 5 && !outputPath.empty()) {
        std::cout << style::italic << fg::green << centerText(std::format("{} fingerprints saved to {}",
                withCommas(results.size()), outputPath), tableWidth) << style::reset << fg::reset << '\n';
    }
}

void printMatchResults(const std::vector<snapmatch::MatchDecision>& decisions,
                       const std::vector<std::string>& placedAt,
                       const fs::path& reportPath)
{
    using snapmatch::MatchStatus;

    constexpr size_t maxRows = 10;

    Table table;
    table.add_row({ "Edited", "Raw Match", "Distance", "Status" });

    for (size_t i : std::views::iota(size_t{ 0 }, std::min(maxRows, decisions.size()))) {
        const auto& d = decisions[i];
        table.add_row({ fs::path(d.editedPath).filename().string(),
                        d.matchedRawPath ? fs::path(*d.matchedRawPath).filename().string() : "-",
                        d.distance ? std::to_string(*d.distance) : "-",
                        std::string(snapmatch::toString(d.status)) });
    }

    table.format().font_align(FontAlign::center);
    table[0].format().font_style({ FontStyle::bold });
    std::cout << table << '\n';

    if (decisions.size() > maxRows) {
        std::cout << "... and " << withCommas(decisions.size() - maxRows) << " more\n";
    }

    const auto count = [&decisions](MatchStatus s) {
        return static_cast<size_t>(std::ranges::count(decisions, s, &snapmatch::MatchDecision::status));
    };

    size_t placed = 0;
    std::uintmax_t placedBytes = 0;
    for (size_t i = 0; i < decisions.size() && i < placedAt.size(); ++i) {
        if (placedAt[i].empty() || !decisions[i].matchedRawPath) continue;
        ++placed;
        std::error_code ec;
        const auto size = fs::file_size(*decisions[i].matchedRawPath, ec);
        if (!ec) placedBytes += size;
    }

    std::cout << '\n'
        << fg::green << "Matched: " << withCommas(count(MatchStatus::Matched)) << fg::reset << " | "
        << fg::yellow << "Not matched: " << withCommas(count(MatchStatus::NoMatch)) << fg::reset << " | "
        << fg::red << "Unreadable: " << withCommas(count(MatchStatus::Error)) << fg::reset << '\n'
        << "Placed " << withCommas(placed) << " file(s) (" << formatFileSize(placedBytes) << ")\n"
        << "Report: " << reportPath.string() << '\n';
}

} // namespace snapmatch_app
