//
// save_results.cpp
// Functions for saving computation results to CSV files
//

#include "save_results.hpp"

#include <fstream>
#include <iostream>

namespace snapmatch_app {

std::string csvQuote(const std::string& field)
{
    std::string out;
    out.reserve(field.size() + 2);
    out += '"';
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

void saveHashesCSV(const std::string& path,
                   const std::vector<snapmatch::FingerprintResult>& results)
{
    std::ofstream csv(path);
    if (!csv) {
        std::cerr << "Warning: Cannot create output file '" << path << "'\n";
        return;
    }

    csv << "filepath,dhash_hex,status\n";
    for (const auto& r : results) {
        csv << csvQuote(r.path) << ','
            << (r.ok() ? r.fingerprint->to_string() : std::string{}) << ','
            << (r.ok() ? "ok" : "error") << '\n';
    }

    if (!csv) {
        std::cerr << "Warning: Failed writing output file '" << path << "'\n";
    }
}

bool saveMappingCSV(const std::string& path,
                    const std::vector<snapmatch::MatchDecision>& decisions,
                    const std::vector<std::string>& copiedTo)
{
    std::ofstream csv(path);
    if (!csv) {
        std::cerr << "Error: Cannot create report file '" << path << "'\n";
        return false;
    }

    csv << "edited,raw_match,distance,status,copied_to\n";
    for (size_t i = 0; i < decisions.size(); ++i) {
        const auto& d = decisions[i];
        const std::string placed = i < copiedTo.size() ? copiedTo[i] : std::string{};

        csv << csvQuote(d.editedPath) << ','
            << (d.matchedRawPath ? csvQuote(*d.matchedRawPath) : std::string{}) << ','
            << (d.distance ? std::to_string(*d.distance) : std::string{}) << ','
            << snapmatch::toString(d.status) << ','
            << (placed.empty() ? std::string{} : csvQuote(placed)) << '\n';
    }

    csv.flush();
    if (!csv) {
        std::cerr << "Error: Failed writing report file '" << path << "'\n";
        return false;
    }
    return true;
}

} // namespace snapmatch_app
