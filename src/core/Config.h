#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace core {

enum class Difficulty { Beginner, Intermediate, Expert, Custom };

struct GameConfig {
    Difficulty  difficulty    = Difficulty::Intermediate;
    int         rows          = 16;
    int         cols          = 16;
    int         mines         = 40;
    std::size_t maxHighScores = 10;
};

inline constexpr int         kMinBoardDim      = 2;
inline constexpr int         kMaxBoardDim      = 99;
inline constexpr std::size_t kMaxHighScoreSlots = 100;

// "beginner", "intermediate", "expert", "custom" (case-insensitive).
[[nodiscard]] std::optional<Difficulty> ParseDifficulty(std::string_view name) noexcept;
[[nodiscard]] const char* DifficultyName(Difficulty d) noexcept;

// Sets difficulty and, for presets, the matching rows/cols/mines:
//   beginner 9x9/10, intermediate 16x16/40, expert 16x30/99.
void ApplyDifficulty(GameConfig& cfg, Difficulty d) noexcept;

// Pulls every field into range: dimensions [2, 99], mines [1, rows*cols - 1],
// maxHighScores [1, 100].
void ClampConfig(GameConfig& cfg) noexcept;

// <dir>/config.ini. Returns false (cfg untouched) when the file is missing or unreadable.
bool LoadConfig(GameConfig& cfg, const std::filesystem::path& dir);
bool SaveConfig(const GameConfig& cfg, const std::filesystem::path& dir);

} // namespace core
