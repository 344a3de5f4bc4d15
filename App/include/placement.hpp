//
// placement.hpp
// Putting matched raw originals into the output folder
//

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

namespace snapmatch_app {

enum class PlacementMode { Copy, Hardlink, Symlink };

// Case-insensitive "copy", "hardlink" or "symlink"
std::optional<PlacementMode> parsePlacementMode(std::string_view value);
std::string_view toString(PlacementMode mode);

/**
 * Chooses output paths for matched raw files. A name already on disk or
 * already handed out in this run gets a numeric suffix:
 * photo.jpg, photo__2.jpg, photo__3.jpg, ...
 */
class PlacementPlanner {
public:
    PlacementPlanner(std::filesystem::path outDirectory,
                     std::filesystem::path rawRoot,
                     bool preserveRawSubdirs);

    // Reserves and returns the destination for one placement of rawPath
    std::filesystem::path destinationFor(const std::filesystem::path& rawPath);

private:
    std::filesystem::path uniqueDestination(const std::filesystem::path& dir, const std::filesystem::path& name);

    std::filesystem::path m_outDirectory;
    std::filesystem::path m_rawRoot;
    bool m_preserveRawSubdirs;
    std::unordered_set<std::string> m_reserved;
};

// rawPath relative to rawRoot, or just its file name if it lies outside
std::filesystem::path relativeUnder(const std::filesystem::path& rawRoot, const std::filesystem::path& rawPath);

/**
 * Copy or link src to dst, creating parent folders. Copies keep the source
 * modification time.
 * @throws std::filesystem::filesystem_error on failure
 */
void placeFile(const std::filesystem::path& src, const std::filesystem::path& dst, PlacementMode mode);

} // namespace snapmatch_app
