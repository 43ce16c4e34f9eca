#include "app/CommandLineArgs.h"

#include <cctype>
#include <charconv>
#include <limits>
#include <sstream>
#include <system_error>

namespace minefield::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// Matches "--opt=value" / "--opt:value" against the lowered arg and returns
// the value cut from the raw (case-preserved) arg.
[[nodiscard]] bool ConsumeValue(std::string_view lowered,
                                std::string_view raw,
                                std::string_view prefix,
                                std::string_view& outValue)
{
    if (!StartsWith(lowered, prefix))
        return false;

    const std::size_t n = prefix.size();
    if (lowered.size() == n)
        return false;

    const char sep = lowered[n];
    if (sep != '=' && sep != ':')
        return false;

    outValue = raw.substr(n + 1);
    return true;
}

[[nodiscard]] std::optional<int> ParseInt(std::string_view s)
{
    if (s.empty())
        return std::nullopt;

    int sign = 1;
    std::size_t i = 0;
    if (s[0] == '+') {
        i = 1;
    } else if (s[0] == '-') {
        sign = -1;
        i = 1;
    }
    if (i == s.size())
        return std::nullopt;

    long long v = 0;
    for (; i < s.size(); ++i)
    {
        const char c = s[i];
        if (c < '0' || c > '9')
            return std::nullopt;
        v = v * 10 + static_cast<long long>(c - '0');
        if (v > 1'000'000'000LL)
            return std::nullopt; // absurd
    }

    v *= sign;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        return std::nullopt;

    return static_cast<int>(v);
}

[[nodiscard]] std::optional<std::uint64_t> ParseU64(std::string_view s)
{
    if (s.empty())
        return std::nullopt;

    std::uint64_t v = 0;
    const char* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, v);
    if (ec != std::errc{} || ptr != end)
        return std::nullopt;
    return v;
}

} // namespace

CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv)
{
    CommandLineArgs out;
    const std::size_t argc = argv.size();

    auto addUnknown = [&](std::string_view raw) {
        out.unknown.emplace_back(raw);
    };

    for (std::size_t i = 1; i < argc; ++i)
    {
        const std::string_view raw = argv[i];
        if (raw.empty())
            continue;

        const std::string lowered = ToLower(raw);
        const std::string_view arg(lowered);

        // Help
        if (arg == "--help" || arg == "-h" || arg == "-?") {
            out.showHelp = true;
            continue;
        }

        // Simple flags
        if (arg == "--show-scores" || arg == "--scores") { out.showScores = true; continue; }
        if (arg == "--clear-scores" || arg == "--reset-scores") { out.clearScores = true; continue; }
        if (arg == "--save-config") { out.saveConfig = true; continue; }

        // Options with values
        std::string_view value;

        // "--opt <value>": consumes the next argv entry, or records the option as bad.
        const auto nextValue = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc) {
                addUnknown(raw);
                return std::nullopt;
            }
            return argv[++i];
        };

        const auto intInto = [&](std::optional<int>& dst, std::optional<std::string_view> v) {
            if (!v)
                return;
            const auto parsed = ParseInt(*v);
            if (!parsed) {
                addUnknown(raw);
                return;
            }
            dst = *parsed;
        };

        const auto seedInto = [&](std::optional<std::string_view> v) {
            if (!v)
                return;
            const auto parsed = ParseU64(*v);
            if (!parsed) {
                addUnknown(raw);
                return;
            }
            out.seed = *parsed;
        };

        const auto textInto = [&](std::optional<std::string>& dst, std::optional<std::string_view> v) {
            if (!v)
                return;
            if (v->empty()) {
                addUnknown(raw);
                return;
            }
            dst = std::string(*v);
        };

        if (arg == "--rows")  { intInto(out.rows, nextValue()); continue; }
        if (ConsumeValue(arg, raw, "--rows", value)) { intInto(out.rows, value); continue; }

        if (arg == "--cols")  { intInto(out.cols, nextValue()); continue; }
        if (ConsumeValue(arg, raw, "--cols", value)) { intInto(out.cols, value); continue; }

        if (arg == "--mines") { intInto(out.mines, nextValue()); continue; }
        if (ConsumeValue(arg, raw, "--mines", value)) { intInto(out.mines, value); continue; }

        if (arg == "--seed")  { seedInto(nextValue()); continue; }
        if (ConsumeValue(arg, raw, "--seed", value)) { seedInto(value); continue; }

        if (arg == "--difficulty") { textInto(out.difficulty, nextValue()); continue; }
        if (ConsumeValue(arg, raw, "--difficulty", value)) { textInto(out.difficulty, value); continue; }

        if (arg == "--scores-file") { textInto(out.scoresFile, nextValue()); continue; }
        if (ConsumeValue(arg, raw, "--scores-file", value)) { textInto(out.scoresFile, value); continue; }

        // Anything else is unknown.
        addUnknown(raw);
    }

    return out;
}

CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv)
{
    std::vector<std::string_view> v;
    if (argc > 0 && argv != nullptr)
    {
        v.reserve(static_cast<std::size_t>(argc));
        for (int i = 0; i < argc; ++i)
            v.emplace_back(argv[i] ? argv[i] : "");
    }
    return ParseCommandLineArgsFromArgv(v);
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream oss;
    oss << "Minefield - Command Line Options\n\n";
    oss << "Board\n";
    oss << "  --difficulty <name>          beginner (9x9, 10), intermediate (16x16, 40),\n";
    oss << "                               expert (16x30, 99)\n";
    oss << "  --rows <2..99>               Board height (implies a custom board)\n";
    oss << "  --cols <2..99>               Board width (implies a custom board)\n";
    oss << "  --mines <n>                  Mine count, 1..rows*cols-1\n";
    oss << "  --seed <n>                   Reproducible mine layouts\n\n";

    oss << "High scores\n";
    oss << "  --scores-file <path>         Use this file instead of highscores.json\n";
    oss << "  --show-scores                Print the high score table and exit\n";
    oss << "  --clear-scores               Erase all high scores and exit\n\n";

    oss << "Misc\n";
    oss << "  --save-config                Write the effective settings to config.ini\n";
    oss << "  --help, -h                   Show this help\n\n";

    oss << "Examples\n";
    oss << "  minefield --difficulty expert\n";
    oss << "  minefield --rows 10 --cols 10 --mines 12 --seed 42\n";
    oss << "  minefield --show-scores\n";
    return oss.str();
}

bool ApplyCommandLineOverrides(core::GameConfig& cfg, const CommandLineArgs& args)
{
    bool ok = true;
    if (args.difficulty)
    {
        if (const auto d = core::ParseDifficulty(*args.difficulty))
            core::ApplyDifficulty(cfg, *d);
        else
            ok = false;
    }

    if (args.rows || args.cols || args.mines)
    {
        cfg.difficulty = core::Difficulty::Custom;
        if (args.rows)  cfg.rows = *args.rows;
        if (args.cols)  cfg.cols = *args.cols;
        if (args.mines) cfg.mines = *args.mines;
    }

    core::ClampConfig(cfg);
    return ok;
}

} // namespace minefield::app
