#include "app/CommandLine.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace blockfall::app {

namespace {

long long parseNumber(const std::string& option, const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument(option + ": missing value");
    }

    errno = 0;
    char* end = nullptr;
    const long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        throw std::invalid_argument(option + ": not a number: " + text);
    }
    return value;
}

int parsePositiveInt(const std::string& option, const std::string& text) {
    const long long value = parseNumber(option, text);
    if (value <= 0 || value > std::numeric_limits<int>::max()) {
        throw std::invalid_argument(option + ": must be a positive integer: " + text);
    }
    return static_cast<int>(value);
}

std::uint32_t parseSeed(const std::string& option, const std::string& text) {
    const long long value = parseNumber(option, text);
    if (value < 0 || value > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument(option + ": out of range: " + text);
    }
    return static_cast<std::uint32_t>(value);
}

} // namespace

CommandLine parseCommandLine(const std::vector<std::string>& args) {
    CommandLine result;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            result.showHelp = true;
            continue;
        }

        if (arg != "--rows" && arg != "--cols" && arg != "--gravity-ms" && arg != "--seed") {
            throw std::invalid_argument("unknown option: " + arg);
        }
        if (i + 1 >= args.size()) {
            throw std::invalid_argument(arg + ": missing value");
        }
        const std::string& value = args[++i];

        if (arg == "--rows") {
            result.config.rows = parsePositiveInt(arg, value);
        } else if (arg == "--cols") {
            result.config.cols = parsePositiveInt(arg, value);
        } else if (arg == "--gravity-ms") {
            result.config.gravityIntervalMs = parsePositiveInt(arg, value);
        } else {
            result.config.seed = parseSeed(arg, value);
        }
    }

    result.config.validate();
    return result;
}

CommandLine parseCommandLine(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parseCommandLine(args);
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "  --rows N        board rows (default 20)\n"
           "  --cols N        board columns (default 10)\n"
           "  --gravity-ms N  forced descent interval in ms (default 1000)\n"
           "  --seed N        fixed seed for the piece sequence\n"
           "  --help          show this message\n";
}

} // namespace blockfall::app
