#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "minefield/game/GameController.hpp"
#include "minefield/scores/HighScores.hpp"

namespace minefield::app {

// Text rendering of a snapshot:
//   '#' hidden, 'F' flag, '*' mine, '.' empty, '1'..'8' numbers.
// After a loss every mine is drawn; a flag on a safe cell stays 'F'.
[[nodiscard]] char CellSymbol(const game::CellView& cell, game::GameState state) noexcept;
[[nodiscard]] std::string RenderBoard(const game::GameSnapshot& snap);
[[nodiscard]] std::string RenderStatus(const game::GameSnapshot& snap);
[[nodiscard]] std::string RenderScores(const std::vector<scores::HighScoreEntry>& entries);
[[nodiscard]] std::string ConsoleHelpText();

struct ConsoleCommand
{
    enum class Kind { Reveal, Flag, Chord, Restart, Scores, Help, Quit, Invalid };

    Kind kind = Kind::Invalid;
    int  row = 0;
    int  col = 0;
};

// "r 3 4", "f 0 0", "c 2 2", "n", "s", "h", "q" (case-insensitive, long
// forms like "reveal"/"flag"/"chord"/"new"/"scores"/"help"/"quit" too).
[[nodiscard]] ConsoleCommand ParseConsoleCommand(std::string_view line);

// Line-oriented game loop over a pair of streams.
class ConsoleSession
{
public:
    ConsoleSession(game::GameController& controller, std::istream& in, std::ostream& out);

    // Runs until 'q' or end of input.
    void run();

    // Applies one command and prints its result. Returns false on quit.
    bool execute(const ConsoleCommand& cmd);

private:
    void printBoard();
    void reportReveal(const std::optional<game::RevealOutcome>& outcome);
    void promptForHighScore();

    game::GameController& m_controller;
    std::istream&         m_in;
    std::ostream&         m_out;
};

} // namespace minefield::app
