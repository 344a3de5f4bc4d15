//
// helpers.hpp
// General utility and helper functions for the SnapMatch CLI application
//

#pragma once

#include <concepts>
#include <cstdint>
#include <filesystem>
#include <format>
#include <iostream>
#include <locale>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <indicators/progress_bar.hpp>

#include "coordinator.hpp"
#include "fingerprint_cache.hpp"
#include "image_decoder.hpp"
#include "matcher.hpp"

#ifdef _WIN32
#include <windows.h>
#endif

namespace snapmatch_app {

class Arguments;

#ifdef _WIN32
    inline void hideCursor() { CONSOLE_CURSOR_INFO info{ .dwSize = 100, .bVisible = FALSE }; SetConsoleCursorInfo(GetStdHandle(STD_OUTPUT_HANDLE), &info); }
    inline void showCursor() { CONSOLE_CURSOR_INFO info{ .dwSize = 100, .bVisible = TRUE }; SetConsoleCursorInfo(GetStdHandle(STD_OUTPUT_HANDLE), &info); }
#else
    inline void hideCursor() { std::cout << "\033[?25l" << std::flush; }
    inline void showCursor() { std::cout << "\033[?25h" << std::flush; }
#endif

// Progress bar creation
indicators::ProgressBar bar(std::string_view prefix, bool show_elapsed = false, bool show_remaining = false);

// Number formatting with the user's locale grouping, falling back to the classic locale
inline std::string withCommas(std::integral auto number)
{
    static const std::locale loc = [] {
        try { return std::locale(""); }
        catch (const std::runtime_error&) { return std::locale::classic(); }
    }();
    return std::format(loc, "{:L}", number);
}

// String manipulation
std::string toLower(std::string s);
std::string centerText(std::string_view text, int width);

/**
 * Scan a folder for images. Result is sorted, which fixes the catalog order
 * and therefore the tie-break between equally close raw images.
 * @throws std::runtime_error if the folder cannot be scanned or holds no matching file
 */
std::vector<std::string> collectImagePaths(const std::filesystem::path& dir,
                                           const std::vector<std::string>& allowedExtensions,
                                           bool recursive);

// File size formatting
std::string formatFileSize(std::uintmax_t bytes);

/**
 * Fingerprint a collection while drawing total/decode/hash progress bars.
 * @param label shown in front of the bars ("Raw", "Edited", ...)
 */
std::vector<snapmatch::FingerprintResult> fingerprintWithProgress(std::string_view label,
                                                                  const std::vector<std::string>& paths,
                                                                  const snapmatch::ImageDecoder& decoder,
                                                                  snapmatch::FingerprintCache* cache,
                                                                  int workers);

// Result display functions
void printConfiguration(const Arguments& args, size_t firstCount, size_t secondCount = 0);

void printHashResults(const std::vector<snapmatch::FingerprintResult>& results, const std::string& outputPath);

void printMatchResults(const std::vector<snapmatch::MatchDecision>& decisions,
                       const std::vector<std::string>& placedAt,
                       const std::filesystem::path& reportPath);

} // namespace snapmatch_app
