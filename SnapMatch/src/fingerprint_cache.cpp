#include "../include/fingerprint_cache.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <format>
#include <fstream>
#include <string_view>

namespace snapmatch {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kHeader = "path,size,mtime_ns,algorithm_version,fingerprint";
constexpr size_t kColumns = 5;

std::string quoteField(const std::string& field)
{
    std::string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (char ch : field) {
        if (ch == '"') out.push_back('"');
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

// Reads one CSV record; quoted fields may contain commas, doubled quotes and newlines.
// Returns false at end of input.
bool readRecord(std::istream& in, std::vector<std::string>& fields)
{
    fields.clear();
    if (in.peek() == std::char_traits<char>::eof()) return false;

    std::string field;
    bool inQuotes = false;
    bool wasQuoted = false;
    char ch;

    while (in.get(ch)) {
        if (inQuotes) {
            if (ch == '"') {
                if (in.peek() == '"') {
                    in.get(ch);
                    field.push_back('"');
                }
                else {
                    inQuotes = false;
                }
            }
            else {
                field.push_back(ch);
            }
            continue;
        }

        if (ch == '"' && field.empty() && !wasQuoted) {
            inQuotes = true;
            wasQuoted = true;
        }
        else if (ch == ',') {
            fields.push_back(std::move(field));
            field.clear();
            wasQuoted = false;
        }
        else if (ch == '\n') {
            break;
        }
        else if (ch != '\r') {
            field.push_back(ch);
        }
    }

    if (inQuotes) throw CacheError("unterminated quoted field");

    fields.push_back(std::move(field));
    return true;
}

template <typename T>
T parseNumber(const std::string& text, std::string_view column)
{
    T value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        throw CacheError(std::format("bad {} value '{}'", column, text));
    }
    return value;
}

CacheEntry parseEntry(const std::vector<std::string>& fields)
{
    if (fields.size() != kColumns) {
        throw CacheError(std::format("expected {} columns, found {}", kColumns, fields.size()));
    }
    if (fields[0].empty()) throw CacheError("empty path");

    const auto fingerprint = ImageFingerprint::parse(fields[4]);
    if (!fingerprint) throw CacheError(std::format("bad fingerprint '{}'", fields[4]));

    CacheEntry entry;
    entry.identity.path = fields[0];
    entry.identity.size = parseNumber<std::uintmax_t>(fields[1], "size");
    entry.identity.mtimeNs = parseNumber<int64_t>(fields[2], "mtime_ns");
    entry.algorithmVersion = parseNumber<int>(fields[3], "algorithm_version");
    entry.fingerprint = *fingerprint;
    return entry;
}

} // namespace

std::optional<FileIdentity> FileIdentity::of(const fs::path& file)
{
    std::error_code ec;
    if (!fs::is_regular_file(file, ec) || ec) return std::nullopt;

    const auto size = fs::file_size(file, ec);
    if (ec) return std::nullopt;

    const auto mtime = fs::last_write_time(file, ec);
    if (ec) return std::nullopt;

    auto canonical = fs::weakly_canonical(file, ec);
    if (ec) {
        canonical = fs::absolute(file, ec).lexically_normal();
        if (ec) return std::nullopt;
    }

    FileIdentity identity;
    identity.path = canonical.string();
    identity.size = size;
    identity.mtimeNs = std::chrono::duration_cast<std::chrono::nanoseconds>(mtime.time_since_epoch()).count();
    return identity;
}

FingerprintCache::FingerprintCache(fs::path storagePath, int algorithmVersion)
    : m_storagePath(std::move(storagePath)), m_algorithmVersion(algorithmVersion)
{
}

std::optional<ImageFingerprint> FingerprintCache::lookup(const FileIdentity& identity) const
{
    const auto it = m_entries.find(identity.path);
    if (it == m_entries.end()) return std::nullopt;

    const CacheEntry& entry = it->second;
    if (entry.identity != identity || entry.algorithmVersion != m_algorithmVersion) {
        return std::nullopt;
    }
    return entry.fingerprint;
}

void FingerprintCache::store(const FileIdentity& identity, ImageFingerprint fingerprint, int algorithmVersion)
{
    m_entries.insert_or_assign(identity.path, CacheEntry{ identity, algorithmVersion, fingerprint });
}

size_t FingerprintCache::prune(const std::unordered_set<std::string>& livePaths)
{
    return std::erase_if(m_entries, [&livePaths](const auto& item) {
        return !livePaths.contains(item.first);
    });
}

bool FingerprintCache::load()
{
    m_entries.clear();
    if (m_storagePath.empty()) return true;

    std::error_code ec;
    if (!fs::exists(m_storagePath, ec)) {
        SNAPMATCH_DEBUG("cache", "no cache at ", m_storagePath.string(), ", starting empty");
        return true;
    }

    std::ifstream in(m_storagePath, std::ios::binary);
    if (!in) {
        SNAPMATCH_WARN("cache", "cannot open ", m_storagePath.string(), ", fingerprints will be recomputed");
        return false;
    }

    size_t skipped = 0;
    try {
        std::vector<std::string> fields;
        if (!readRecord(in, fields)) return true;

        std::string header;
        for (size_t i = 0; i < fields.size(); ++i) {
            if (i) header += ',';
            header += fields[i];
        }
        if (header != kHeader) throw CacheError("unexpected header '" + header + "'");

        while (readRecord(in, fields)) {
            if (fields.size() == 1 && fields[0].empty()) continue;
            try {
                CacheEntry entry = parseEntry(fields);
                m_entries.insert_or_assign(entry.identity.path, std::move(entry));
            }
            catch (const CacheError& e) {
                ++skipped;
                SNAPMATCH_DEBUG("cache", "skipping row: ", e.what());
            }
        }
    }
    catch (const CacheError& e) {
        m_entries.clear();
        SNAPMATCH_WARN("cache", m_storagePath.string(), " is corrupt (", e.what(), "), fingerprints will be recomputed");
        return false;
    }

    if (in.bad()) {
        m_entries.clear();
        SNAPMATCH_WARN("cache", "read error on ", m_storagePath.string(), ", fingerprints will be recomputed");
        return false;
    }

    if (skipped > 0) {
        SNAPMATCH_WARN("cache", "skipped ", skipped, " malformed row(s) in ", m_storagePath.string());
    }
    SNAPMATCH_INFO("cache", "loaded ", m_entries.size(), " entries from ", m_storagePath.string());
    return true;
}

bool FingerprintCache::persist() const
{
    if (m_storagePath.empty()) return true;

    std::error_code ec;
    if (m_storagePath.has_parent_path()) {
        fs::create_directories(m_storagePath.parent_path(), ec);
        if (ec) {
            SNAPMATCH_WARN("cache", "cannot create ", m_storagePath.parent_path().string(), ": ", ec.message());
            return false;
        }
    }

    fs::path temp = m_storagePath;
    temp += ".tmp";

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            SNAPMATCH_WARN("cache", "cannot write ", temp.string(), ", cache not saved");
            return false;
        }

        out << kHeader << '\n';
        for (const CacheEntry& entry : entries()) {
            out << quoteField(entry.identity.path) << ','
                << entry.identity.size << ','
                << entry.identity.mtimeNs << ','
                << entry.algorithmVersion << ','
                << entry.fingerprint.to_string() << '\n';
        }

        out.flush();
        if (!out) {
            SNAPMATCH_WARN("cache", "write to ", temp.string(), " failed, cache not saved");
            out.close();
            fs::remove(temp, ec);
            return false;
        }
    }

    fs::rename(temp, m_storagePath, ec);
    if (ec) {
        SNAPMATCH_WARN("cache", "cannot replace ", m_storagePath.string(), ": ", ec.message());
        std::error_code ignored;
        fs::remove(temp, ignored);
        return false;
    }

    SNAPMATCH_INFO("cache", "saved ", m_entries.size(), " entries to ", m_storagePath.string());
    return true;
}

std::vector<CacheEntry> FingerprintCache::entries() const
{
    std::vector<CacheEntry> out;
    out.reserve(m_entries.size());
    for (const auto& [path, entry] : m_entries) out.push_back(entry);

    std::ranges::sort(out, {}, [](const CacheEntry& e) -> const std::string& { return e.identity.path; });
    return out;
}

} // namespace snapmatch
