#pragma once

#include "utils/config.hpp"

#include <ostream>
#include <string>

namespace convo {
namespace utils {

struct CommandLineOptions {
    std::string input;
    std::string output;
    std::string configPath = "config/analyzer.json";
    bool showHelp = false;
    bool showDetails = false;
};

void printUsage(std::ostream& out, const std::string& program);

/**
 * Loads the configuration named by --config (or the default path) into
 * config, then applies the remaining options on top of it. Malformed
 * arguments throw ConfigurationException.
 */
CommandLineOptions parseCommandLine(int argc, const char* const argv[], Config& config);

} // namespace utils
} // namespace convo
