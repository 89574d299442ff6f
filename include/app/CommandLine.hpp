#pragma once

#include <string>
#include <vector>

#include "core/GameConfig.hpp"

namespace blockfall::app {

struct CommandLine {
    core::GameConfig config;
    bool showHelp{false};
};

// Parses --rows N, --cols N, --gravity-ms N, --seed N and --help.
// Throws std::invalid_argument on unknown options or bad values.
CommandLine parseCommandLine(const std::vector<std::string>& args);
CommandLine parseCommandLine(int argc, char** argv);

std::string usage(const std::string& program);

} // namespace blockfall::app
