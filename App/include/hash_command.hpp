#pragma once

#include "arguments.hpp"

namespace snapmatch_app {

/**
 * Handles the 'hash' command for fingerprinting one image collection
 * @param args Command arguments containing directory, output and cache options
 * @return 0 on success, 1 on error
 */
int handleHashCommand(const Arguments& args);

} // namespace snapmatch_app
