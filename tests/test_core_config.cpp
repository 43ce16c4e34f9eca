// tests/test_core_config.cpp
//
// Regression/robustness tests for src/core/Config.{h,cpp}.
//
// Goals:
//   - Saving creates the directory + writes config.ini
//   - Loading round-trips values
//   - Presets, clamping, comments and corrupt values behave predictably

#include <doctest/doctest.h>

#include "core/Config.h"

#include "test_support/TempDir.h"

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace {

void WriteIni(const fs::path& dir, const std::string& text)
{
    fs::create_directories(dir);
    std::ofstream f(dir / "config.ini", std::ios::binary | std::ios::trunc);
    f << text;
}

} // namespace

TEST_CASE("core::SaveConfig creates config.ini and core::LoadConfig round-trips values")
{
    minefield::test::TempDir tmp("config_roundtrip");
    const fs::path dir = tmp.path() / "nested";

    core::GameConfig cfg;
    cfg.difficulty = core::Difficulty::Custom;
    cfg.rows = 10;
    cfg.cols = 12;
    cfg.mines = 20;
    cfg.maxHighScores = 5;

    CHECK(core::SaveConfig(cfg, dir));
    CHECK(fs::exists(dir / "config.ini"));

    core::GameConfig loaded;
    CHECK(core::LoadConfig(loaded, dir));
    CHECK(loaded.difficulty == core::Difficulty::Custom);
    CHECK(loaded.rows == 10);
    CHECK(loaded.cols == 12);
    CHECK(loaded.mines == 20);
    CHECK(loaded.maxHighScores == 5);
}

TEST_CASE("core::LoadConfig returns false for missing file (first run)")
{
    minefield::test::TempDir tmp("config_missing");

    core::GameConfig cfg;
    CHECK_FALSE(core::LoadConfig(cfg, tmp.path()));
    CHECK(cfg.difficulty == core::Difficulty::Intermediate);
    CHECK(cfg.rows == 16);
    CHECK(cfg.cols == 16);
    CHECK(cfg.mines == 40);
    CHECK(cfg.maxHighScores == 10);
}

TEST_CASE("A difficulty preset overrides explicit dimensions")
{
    minefield::test::TempDir tmp("config_preset");
    WriteIni(tmp.path(), "difficulty = Expert\nrows=5\ncols=5\nmines=3\n");

    core::GameConfig cfg;
    REQUIRE(core::LoadConfig(cfg, tmp.path()));
    CHECK(cfg.difficulty == core::Difficulty::Expert);
    CHECK(cfg.rows == 16);
    CHECK(cfg.cols == 30);
    CHECK(cfg.mines == 99);
}

TEST_CASE("Dimensions without a preset make a custom board")
{
    minefield::test::TempDir tmp("config_custom");
    WriteIni(tmp.path(), "rows=8\nmines=6\n");

    core::GameConfig cfg;
    REQUIRE(core::LoadConfig(cfg, tmp.path()));
    CHECK(cfg.difficulty == core::Difficulty::Custom);
    CHECK(cfg.rows == 8);
    CHECK(cfg.cols == 16);
    CHECK(cfg.mines == 6);
}

TEST_CASE("Comments, BOM and corrupt values do not break loading")
{
    minefield::test::TempDir tmp("config_corrupt");
    WriteIni(tmp.path(),
             "\xEF\xBB\xBF"
             "# full-line comment\n"
             "; another\n"
             "rows=12   # inline comment\n"
             "cols=abc\n"
             "mines=12x\n"
             "maxHighScores=-3\n"
             "difficulty=impossible\n"
             "no equals sign here\n"
             "=orphan\n");

    core::GameConfig cfg;
    REQUIRE(core::LoadConfig(cfg, tmp.path()));
    CHECK(cfg.difficulty == core::Difficulty::Custom);
    CHECK(cfg.rows == 12);
    CHECK(cfg.cols == 16);
    CHECK(cfg.mines == 40);
    CHECK(cfg.maxHighScores == 10);
}

TEST_CASE("core::ClampConfig keeps boards playable")
{
    core::GameConfig cfg;
    cfg.rows = 1;
    cfg.cols = 500;
    cfg.mines = 100000;
    cfg.maxHighScores = 0;
    core::ClampConfig(cfg);
    CHECK(cfg.rows == core::kMinBoardDim);
    CHECK(cfg.cols == core::kMaxBoardDim);
    CHECK(cfg.mines == cfg.rows * cfg.cols - 1);
    CHECK(cfg.maxHighScores == 1);

    cfg.mines = 0;
    core::ClampConfig(cfg);
    CHECK(cfg.mines == 1);
}

TEST_CASE("Difficulty names parse case-insensitively and round-trip")
{
    CHECK(core::ParseDifficulty("BEGINNER") == core::Difficulty::Beginner);
    CHECK(core::ParseDifficulty("Intermediate") == core::Difficulty::Intermediate);
    CHECK_FALSE(core::ParseDifficulty("hard").has_value());

    for (auto d : {core::Difficulty::Beginner, core::Difficulty::Intermediate,
                   core::Difficulty::Expert, core::Difficulty::Custom})
        CHECK(core::ParseDifficulty(core::DifficultyName(d)) == d);

    core::GameConfig cfg;
    core::ApplyDifficulty(cfg, core::Difficulty::Beginner);
    CHECK(cfg.rows == 9);
    CHECK(cfg.cols == 9);
    CHECK(cfg.mines == 10);
}
