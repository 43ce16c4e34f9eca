// tests/test_high_scores.cpp
//
// HighScoreManager persistence: ordering, capacity, corrupt/legacy files and
// save failures that must not take the game down.

#include <doctest/doctest.h>

#include "minefield/scores/HighScores.hpp"

#include "io/AtomicFile.h"
#include "test_support/TempDir.h"

#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

using minefield::scores::HighScoreEntry;
using minefield::scores::HighScoreManager;

namespace {

void WriteText(const fs::path& p, const std::string& text)
{
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f << text;
}

} // namespace

TEST_CASE("A missing score file is an empty leaderboard")
{
    minefield::test::TempDir dir("scores_missing");
    HighScoreManager hs(dir.path() / "highscores.json");

    CHECK(hs.scores().empty());
    CHECK(hs.maxScores() == HighScoreManager::kDefaultMaxScores);
    CHECK(hs.qualifiesForHighScore(9999.0));
    CHECK_FALSE(fs::exists(hs.file()));
}

TEST_CASE("Scores are kept sorted ascending and persisted")
{
    minefield::test::TempDir dir("scores_sorted");
    const fs::path file = dir.path() / "nested" / "highscores.json";

    {
        HighScoreManager hs(file);
        CHECK(hs.addScore("Slow", 120.5));
        CHECK(hs.addScore("Fast", 30.0));
        CHECK(hs.addScore("Mid", 75.25));
    }

    HighScoreManager reloaded(file);
    const auto scores = reloaded.getScores();
    REQUIRE(scores.size() == 3);
    CHECK(scores[0].playerName == "Fast");
    CHECK(scores[1].playerName == "Mid");
    CHECK(scores[2].playerName == "Slow");
    CHECK(scores[1].completionTime == doctest::Approx(75.25));

    std::string text;
    REQUIRE(minefield::io::read_all(file, text));
    const auto doc = nlohmann::json::parse(text);
    CHECK(doc.at("format").get<std::string>() == "Minefield.HighScores");
    CHECK(doc.at("version").get<int>() == 1);
    CHECK(doc.at("scores").size() == 3u);
    CHECK(doc.at("scores")[0].at("player_name").get<std::string>() == "Fast");
}

TEST_CASE("The list is capped and only strictly faster times qualify when full")
{
    minefield::test::TempDir dir("scores_cap");
    HighScoreManager hs(dir.path() / "highscores.json", 3);

    CHECK(hs.addScore("a", 50.0));
    CHECK(hs.addScore("b", 40.0));
    CHECK(hs.addScore("c", 30.0));
    CHECK(hs.addScore("d", 20.0));

    REQUIRE(hs.scores().size() == 3);
    CHECK(hs.scores()[0].playerName == "d");
    CHECK(hs.scores()[2].playerName == "b");

    CHECK_FALSE(hs.qualifiesForHighScore(45.0));
    CHECK_FALSE(hs.qualifiesForHighScore(40.0));
    CHECK(hs.qualifiesForHighScore(39.0));

    CHECK_FALSE(hs.addScore("late", 45.0));
    CHECK(hs.scores().size() == 3);
    CHECK(hs.scores()[2].playerName == "b");
}

TEST_CASE("Equal times keep insertion order")
{
    minefield::test::TempDir dir("scores_ties");
    HighScoreManager hs(dir.path() / "highscores.json");

    hs.addScore("first", 10.0);
    hs.addScore("second", 10.0);

    REQUIRE(hs.scores().size() == 2);
    CHECK(hs.scores()[0].playerName == "first");
    CHECK(hs.scores()[1].playerName == "second");
}

TEST_CASE("A corrupt score file loads as empty and is replaced on the next save")
{
    minefield::test::TempDir dir("scores_corrupt");
    const fs::path file = dir.path() / "highscores.json";
    WriteText(file, "{ this is not json");

    HighScoreManager hs(file);
    CHECK(hs.scores().empty());

    CHECK(hs.addScore("Recovered", 42.0));

    HighScoreManager reloaded(file);
    REQUIRE(reloaded.scores().size() == 1);
    CHECK(reloaded.scores()[0].playerName == "Recovered");
}

TEST_CASE("An unknown document format is ignored")
{
    minefield::test::TempDir dir("scores_format");
    const fs::path file = dir.path() / "highscores.json";
    WriteText(file, R"({"format":"Something.Else","version":1,"scores":[{"player_name":"x","completion_time":1}]})");

    HighScoreManager hs(file);
    CHECK(hs.scores().empty());
}

TEST_CASE("A legacy bare array with a BOM is still read; malformed records are skipped")
{
    minefield::test::TempDir dir("scores_legacy");
    const fs::path file = dir.path() / "highscores.json";
    WriteText(file,
              "\xEF\xBB\xBF"
              R"([
                   {"player_name":"Bob","completion_time":88,"date_achieved":"2023-01-02T03:04:05"},
                   {"player_name":"NoTime"},
                   {"player_name":"Neg","completion_time":-5},
                   42,
                   {"player_name":"Amy","completion_time":12.5}
                 ])");

    HighScoreManager hs(file);
    REQUIRE(hs.scores().size() == 2);
    CHECK(hs.scores()[0].playerName == "Amy");
    CHECK(hs.scores()[0].dateAchieved.empty());
    CHECK(hs.scores()[1].playerName == "Bob");
    CHECK(hs.scores()[1].dateAchieved == "2023-01-02T03:04:05");
}

TEST_CASE("An oversized file on disk is trimmed to the cap on load")
{
    minefield::test::TempDir dir("scores_trim");
    const fs::path file = dir.path() / "highscores.json";

    nlohmann::json list = nlohmann::json::array();
    for (int i = 0; i < 8; ++i)
        list.push_back(nlohmann::json{{"player_name", "p" + std::to_string(i)}, {"completion_time", 100 - i}});
    WriteText(file, nlohmann::json{{"format", "Minefield.HighScores"}, {"version", 1}, {"scores", list}}.dump());

    HighScoreManager hs(file, 5);
    REQUIRE(hs.scores().size() == 5);
    CHECK(hs.scores().front().playerName == "p7");
    CHECK(hs.scores().back().playerName == "p3");
}

TEST_CASE("clearScores empties the list on disk too")
{
    minefield::test::TempDir dir("scores_clear");
    const fs::path file = dir.path() / "highscores.json";

    HighScoreManager hs(file);
    hs.addScore("x", 1.0);
    REQUIRE(hs.clearScores());
    CHECK(hs.scores().empty());

    HighScoreManager reloaded(file);
    CHECK(reloaded.scores().empty());
}

TEST_CASE("A failed save keeps the score in memory")
{
    minefield::test::TempDir dir("scores_blocked");
    const fs::path blocker = dir.path() / "blocker";
    WriteText(blocker, "not a directory");

    HighScoreManager hs(blocker / "highscores.json");
    CHECK(hs.scores().empty());

    CHECK(hs.addScore("Ghost", 5.0));
    REQUIRE(hs.scores().size() == 1);
    CHECK(hs.scores()[0].playerName == "Ghost");
    CHECK_FALSE(hs.saveScores());
}

TEST_CASE("HighScoreEntry::Create stamps an ISO-8601 local time")
{
    const HighScoreEntry e = HighScoreEntry::Create("Zed", 3.5);
    CHECK(e.playerName == "Zed");
    CHECK(e.completionTime == doctest::Approx(3.5));
    REQUIRE(e.dateAchieved.size() == 19);
    CHECK(e.dateAchieved[4] == '-');
    CHECK(e.dateAchieved[10] == 'T');
    CHECK(e.dateAchieved[13] == ':');
}
