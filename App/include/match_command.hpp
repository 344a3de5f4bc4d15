#pragma once

#include "arguments.hpp"

namespace snapmatch_app {

/**
 * Handles the 'match' command: find the raw original of every edited image,
 * place the matches in the output folder and write mapping.csv there
 * @param args Command arguments containing raw, edited and output folders and matching options
 * @return 0 on success, 1 on error
 */
int handleMatchCommand(const Arguments& args);

} // namespace snapmatch_app
