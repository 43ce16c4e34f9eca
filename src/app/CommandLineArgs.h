#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/Config.h"

namespace minefield::app {

// Parsed command-line arguments for the minefield executable.
//
// Notes:
//   - All option names are case-insensitive (values keep their case).
//   - "--opt value", "--opt=value" and "--opt:value" forms are supported.
//   - Values given here override config.ini.
struct CommandLineArgs
{
    bool showHelp = false;      // --help / -h / -?
    bool showScores = false;    // --show-scores
    bool clearScores = false;   // --clear-scores
    bool saveConfig = false;    // --save-config

    std::optional<int> rows;            // --rows <n>
    std::optional<int> cols;            // --cols <n>
    std::optional<int> mines;           // --mines <n>
    std::optional<std::string> difficulty; // --difficulty <name>
    std::optional<std::uint64_t> seed;  // --seed <n>
    std::optional<std::string> scoresFile; // --scores-file <path>

    // Any unknown/unsupported args are collected here (so we can show a useful error).
    std::vector<std::string> unknown;
};

// argv[0] is the program name and is skipped.
[[nodiscard]] CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

// Layers the options over `cfg`: a difficulty preset first, then explicit
// rows/cols/mines (which make the board custom), then ClampConfig.
// Returns false if --difficulty names no known preset; cfg keeps the rest.
bool ApplyCommandLineOverrides(core::GameConfig& cfg, const CommandLineArgs& args);

} // namespace minefield::app
