#include "Config.h"

#include "io/AtomicFile.h"
#include "util/TextEncoding.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>

namespace core {

static std::filesystem::path Path(const std::filesystem::path& dir) {
    return dir / "config.ini";
}

static inline void TrimInPlace(std::string& s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());

    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

static bool ParseInt(std::string_view sv, int& out) noexcept
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);

    int v = 0;
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc{} || ptr != end)
        return false;

    out = v;
    return true;
}

static bool EqualsI(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        const unsigned char ca = static_cast<unsigned char>(a[i]);
        const unsigned char cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb))
            return false;
    }

    return true;
}

std::optional<Difficulty> ParseDifficulty(std::string_view name) noexcept
{
    if (EqualsI(name, "beginner"))     return Difficulty::Beginner;
    if (EqualsI(name, "intermediate")) return Difficulty::Intermediate;
    if (EqualsI(name, "expert"))       return Difficulty::Expert;
    if (EqualsI(name, "custom"))       return Difficulty::Custom;
    return std::nullopt;
}

const char* DifficultyName(Difficulty d) noexcept
{
    switch (d)
    {
    case Difficulty::Beginner:     return "beginner";
    case Difficulty::Intermediate: return "intermediate";
    case Difficulty::Expert:       return "expert";
    case Difficulty::Custom:       return "custom";
    }
    return "custom";
}

void ApplyDifficulty(GameConfig& cfg, Difficulty d) noexcept
{
    cfg.difficulty = d;
    switch (d)
    {
    case Difficulty::Beginner:     cfg.rows = 9;  cfg.cols = 9;  cfg.mines = 10; break;
    case Difficulty::Intermediate: cfg.rows = 16; cfg.cols = 16; cfg.mines = 40; break;
    case Difficulty::Expert:       cfg.rows = 16; cfg.cols = 30; cfg.mines = 99; break;
    case Difficulty::Custom:       break;
    }
}

void ClampConfig(GameConfig& cfg) noexcept
{
    cfg.rows = std::clamp(cfg.rows, kMinBoardDim, kMaxBoardDim);
    cfg.cols = std::clamp(cfg.cols, kMinBoardDim, kMaxBoardDim);
    cfg.mines = std::clamp(cfg.mines, 1, cfg.rows * cfg.cols - 1);
    cfg.maxHighScores = std::clamp<std::size_t>(cfg.maxHighScores, 1, kMaxHighScoreSlots);
}

// Tiny INI-style parser: key=value lines
bool LoadConfig(GameConfig& cfg, const std::filesystem::path& dir)
{
    const auto path = Path(dir);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return false; // first run

    std::string text;
    std::string err;
    if (!minefield::io::read_all(path, text, &err, /*max_bytes=*/64u * 1024u))
    {
        spdlog::warn("LoadConfig: failed to read {} ({})", path.string(), err);
        return false;
    }

    if (!minefield::util::NormalizeTextToUtf8(text))
    {
        spdlog::warn("LoadConfig: {} is not UTF-8", path.string());
        return false;
    }

    std::optional<Difficulty> difficulty;
    std::optional<int> rows, cols, mines, maxScores;

    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line))
    {
        std::string tmp = line;
        TrimInPlace(tmp);
        if (tmp.empty()) continue;
        if (tmp[0] == '#' || tmp[0] == ';') continue;

        const auto pos = tmp.find('=');
        if (pos == std::string::npos) continue;

        std::string k = tmp.substr(0, pos);
        std::string v = tmp.substr(pos + 1);
        TrimInPlace(k);
        TrimInPlace(v);

        // Trailing inline comments:  rows=16  # classic
        {
            const std::size_t cut = std::min(v.find('#'), v.find(';'));
            if (cut != std::string::npos)
            {
                v.erase(cut);
                TrimInPlace(v);
            }
        }

        if (k.empty()) continue;

        int parsed = 0;
        if (EqualsI(k, "difficulty"))
        {
            if (auto d = ParseDifficulty(v))
                difficulty = *d;
            else
                spdlog::warn("LoadConfig: unknown difficulty '{}' ignored", v);
        }
        else if (EqualsI(k, "rows") && ParseInt(v, parsed))
        {
            rows = parsed;
        }
        else if (EqualsI(k, "cols") && ParseInt(v, parsed))
        {
            cols = parsed;
        }
        else if (EqualsI(k, "mines") && ParseInt(v, parsed))
        {
            mines = parsed;
        }
        else if (EqualsI(k, "maxHighScores") && ParseInt(v, parsed) && parsed > 0)
        {
            maxScores = parsed;
        }
    }

    // A preset wins over explicit dimensions; rows/cols/mines alone mean "custom".
    if (difficulty && *difficulty != Difficulty::Custom)
    {
        ApplyDifficulty(cfg, *difficulty);
    }
    else if (difficulty || rows || cols || mines)
    {
        cfg.difficulty = Difficulty::Custom;
        if (rows)  cfg.rows = *rows;
        if (cols)  cfg.cols = *cols;
        if (mines) cfg.mines = *mines;
    }
    if (maxScores)
        cfg.maxHighScores = static_cast<std::size_t>(*maxScores);

    ClampConfig(cfg);
    return true;
}

bool SaveConfig(const GameConfig& cfg, const std::filesystem::path& dir)
{
    std::ostringstream oss;
    oss << "difficulty="    << DifficultyName(cfg.difficulty) << "\n";
    oss << "rows="          << cfg.rows  << "\n";
    oss << "cols="          << cfg.cols  << "\n";
    oss << "mines="         << cfg.mines << "\n";
    oss << "maxHighScores=" << cfg.maxHighScores << "\n";
    const std::string text = oss.str();

    const auto path = Path(dir);

    std::string err;
    if (!minefield::io::write_atomic(path, text, &err))
    {
        spdlog::error("SaveConfig: write failed for {} ({})", path.string(), err);
        return false;
    }
    return true;
}

} // namespace core
