//
// save_results.hpp
// Functions for saving computation results to CSV files
//

#pragma once

#include <string>
#include <vector>

#include "coordinator.hpp"
#include "matcher.hpp"

namespace snapmatch_app {

// Quote a CSV field, doubling embedded quotes
std::string csvQuote(const std::string& field);

/**
 * Save computed fingerprints to a CSV file
 * @param path Output file path
 * @param results One entry per input file, in input order
 */
void saveHashesCSV(const std::string& path,
                   const std::vector<snapmatch::FingerprintResult>& results);

/**
 * Save the edited-to-raw mapping report
 * @param path Output file path
 * @param decisions One decision per edited image
 * @param copiedTo Destination of the placed raw file per decision, empty if nothing was placed
 * @return false if the report could not be written
 */
bool saveMappingCSV(const std::string& path,
                    const std::vector<snapmatch::MatchDecision>& decisions,
                    const std::vector<std::string>& copiedTo);

} // namespace snapmatch_app
