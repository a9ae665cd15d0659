#pragma once

#include <optional>
#include <string>
#include <vector>

namespace frontier::app {

// Parsed command-line arguments for frontier_sim.
//
// Notes:
//   - Option names are case-insensitive.
//   - Both "--flag=value" and "--flag value" forms are supported.
struct CommandLineArgs
{
    bool showHelp = false;          // --help / -h
    bool verbose = false;           // --verbose (debug logging)
    bool disaster = true;           // --no-disaster skips the demo event

    std::optional<std::string> configPath;   // --config <file>
    std::optional<std::string> catalogPath;  // --catalog <file>
    std::optional<std::string> logDir;       // --log-dir <dir>
    std::optional<std::string> dumpPath;     // --dump <file> (final store as JSON)

    std::optional<int> hours;                // --hours <N>  simulated hours (default 24)
    std::optional<int> settlements;          // --settlements <N> (default 4)
    std::optional<int> threads;              // --threads <N>
    std::optional<long long> seed;           // --seed <N>

    // Any unknown/unsupported args are collected here (so we can show a useful error).
    std::vector<std::string> unknown;
};

[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, char** argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace frontier::app
