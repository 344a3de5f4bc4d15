#include "placement.hpp"
#include "helpers.hpp"

#include <format>

namespace snapmatch_app {

namespace fs = std::filesystem;

std::optional<PlacementMode> parsePlacementMode(std::string_view value)
{
    const std::string mode = toLower(std::string(value));
    if (mode == "copy") return PlacementMode::Copy;
    if (mode == "hardlink") return PlacementMode::Hardlink;
    if (mode == "symlink") return PlacementMode::Symlink;
    return std::nullopt;
}

std::string_view toString(PlacementMode mode)
{
    switch (mode) {
        case PlacementMode::Copy: return "copy";
        case PlacementMode::Hardlink: return "hardlink";
        case PlacementMode::Symlink: return "symlink";
    }
    return "unknown";
}

fs::path relativeUnder(const fs::path& rawRoot, const fs::path& rawPath)
{
    const fs::path rel = rawPath.lexically_normal().lexically_relative(rawRoot.lexically_normal());
    if (rel.empty() || *rel.begin() == "..") return rawPath.filename();
    return rel;
}

PlacementPlanner::PlacementPlanner(fs::path outDirectory, fs::path rawRoot, bool preserveRawSubdirs)
    : m_outDirectory(std::move(outDirectory)),
      m_rawRoot(std::move(rawRoot)),
      m_preserveRawSubdirs(preserveRawSubdirs)
{
}

fs::path PlacementPlanner::destinationFor(const fs::path& rawPath)
{
    if (m_preserveRawSubdirs) {
        const fs::path rel = relativeUnder(m_rawRoot, rawPath);
        return uniqueDestination(m_outDirectory / rel.parent_path(), rel.filename());
    }
    return uniqueDestination(m_outDirectory, rawPath.filename());
}

fs::path PlacementPlanner::uniqueDestination(const fs::path& dir, const fs::path& name)
{
    auto isFree = [this](const fs::path& candidate) {
        std::error_code ec;
        return !m_reserved.contains(candidate.string()) && !fs::exists(fs::symlink_status(candidate, ec));
    };

    fs::path candidate = dir / name;
    for (int n = 2; !isFree(candidate); ++n) {
        candidate = dir / std::format("{}__{}{}", name.stem().string(), n, name.extension().string());
    }

    m_reserved.insert(candidate.string());
    return candidate;
}

void placeFile(const fs::path& src, const fs::path& dst, PlacementMode mode)
{
    if (dst.has_parent_path()) fs::create_directories(dst.parent_path());

    switch (mode) {
        case PlacementMode::Copy:
            fs::copy_file(src, dst, fs::copy_options::overwrite_existing);
            fs::last_write_time(dst, fs::last_write_time(src));
            break;
        case PlacementMode::Hardlink:
            if (fs::exists(fs::symlink_status(dst))) fs::remove(dst);
            fs::create_hard_link(src, dst);
            break;
        case PlacementMode::Symlink:
            if (fs::exists(fs::symlink_status(dst))) fs::remove(dst);
            fs::create_symlink(fs::absolute(src), dst);
            break;
    }
}

} // namespace snapmatch_app
