#include "app/ConsoleView.h"

#include <cctype>
#include <iomanip>
#include <istream>
#include <ostream>
#include <sstream>
#include <utility>

#include <spdlog/spdlog.h>

namespace minefield::app {

using game::GameState;

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] std::string Trimmed(std::string s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.pop_back();
    std::size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])))
        ++i;
    return s.substr(i);
}

} // namespace

char CellSymbol(const game::CellView& cell, GameState state) noexcept
{
    if (state == GameState::Lost && cell.isMine)
        return '*';
    if (cell.isFlagged)
        return 'F';
    if (!cell.isRevealed)
        return '#';
    if (cell.isMine)
        return '*';
    if (cell.adjacentMines == 0)
        return '.';
    return static_cast<char>('0' + cell.adjacentMines);
}

std::string RenderBoard(const game::GameSnapshot& snap)
{
    std::ostringstream oss;

    oss << "   ";
    for (int c = 0; c < snap.cols; ++c)
        oss << std::setw(3) << c;
    oss << '\n';

    for (int r = 0; r < snap.rows; ++r)
    {
        oss << std::setw(3) << r;
        for (int c = 0; c < snap.cols; ++c)
            oss << std::setw(3) << CellSymbol(snap.at(r, c), snap.state);
        oss << '\n';
    }
    return oss.str();
}

std::string RenderStatus(const game::GameSnapshot& snap)
{
    std::ostringstream oss;
    oss << "State: " << game::GameStateName(snap.state)
        << "  Mines left: " << snap.minesRemaining
        << "  Time: " << snap.elapsedSeconds << "s";
    return oss.str();
}

std::string RenderScores(const std::vector<scores::HighScoreEntry>& entries)
{
    if (entries.empty())
        return "No high scores yet.\n";

    std::ostringstream oss;
    oss << "High scores\n";
    int rank = 1;
    for (const auto& e : entries)
    {
        oss << std::setw(3) << rank++ << ". "
            << std::left << std::setw(20) << e.playerName << std::right
            << std::fixed << std::setprecision(1) << std::setw(8) << e.completionTime << "s  "
            << e.dateAchieved << '\n';
    }
    return oss.str();
}

std::string ConsoleHelpText()
{
    return
        "Commands\n"
        "  r ROW COL   reveal a cell\n"
        "  f ROW COL   toggle a flag\n"
        "  c ROW COL   chord: open the neighbours of a satisfied number\n"
        "  n           new game\n"
        "  s           show high scores\n"
        "  h           this help\n"
        "  q           quit\n";
}

ConsoleCommand ParseConsoleCommand(std::string_view line)
{
    using Kind = ConsoleCommand::Kind;

    std::istringstream iss{std::string(line)};
    std::string verb;
    if (!(iss >> verb))
        return {};

    verb = ToLower(verb);

    ConsoleCommand cmd;
    if (verb == "n" || verb == "new")        cmd.kind = Kind::Restart;
    else if (verb == "s" || verb == "scores") cmd.kind = Kind::Scores;
    else if (verb == "h" || verb == "help" || verb == "?") cmd.kind = Kind::Help;
    else if (verb == "q" || verb == "quit")  cmd.kind = Kind::Quit;
    else if (verb == "r" || verb == "reveal") cmd.kind = Kind::Reveal;
    else if (verb == "f" || verb == "flag")  cmd.kind = Kind::Flag;
    else if (verb == "c" || verb == "chord") cmd.kind = Kind::Chord;
    else
        return {};

    const bool needsCell = cmd.kind == Kind::Reveal || cmd.kind == Kind::Flag || cmd.kind == Kind::Chord;
    if (needsCell && !(iss >> cmd.row >> cmd.col))
        return {};

    std::string extra;
    if (iss >> extra)
        return {};

    return cmd;
}

ConsoleSession::ConsoleSession(game::GameController& controller, std::istream& in, std::ostream& out)
    : m_controller(controller), m_in(in), m_out(out)
{
}

void ConsoleSession::run()
{
    m_out << ConsoleHelpText() << '\n';
    printBoard();

    std::string line;
    while (true)
    {
        m_out << "> " << std::flush;
        if (!std::getline(m_in, line))
            break;

        if (Trimmed(line).empty())
            continue;

        if (!execute(ParseConsoleCommand(line)))
            break;
    }
}

bool ConsoleSession::execute(const ConsoleCommand& cmd)
{
    using Kind = ConsoleCommand::Kind;

    switch (cmd.kind)
    {
    case Kind::Quit:
        return false;

    case Kind::Help:
        m_out << ConsoleHelpText();
        return true;

    case Kind::Scores:
        m_out << RenderScores(m_controller.highScores().getScores());
        return true;

    case Kind::Restart:
        m_controller.restartGame();
        printBoard();
        return true;

    case Kind::Reveal:
        reportReveal(m_controller.revealCell(cmd.row, cmd.col));
        return true;

    case Kind::Chord:
        reportReveal(m_controller.chordReveal(cmd.row, cmd.col));
        return true;

    case Kind::Flag:
        if (!m_controller.toggleFlag(cmd.row, cmd.col))
            m_out << "Can't flag that cell.\n";
        else
            printBoard();
        return true;

    case Kind::Invalid:
        break;
    }

    m_out << "Unrecognised command (h for help).\n";
    return true;
}

void ConsoleSession::printBoard()
{
    const auto snap = m_controller.snapshot();
    m_out << RenderBoard(snap) << RenderStatus(snap) << '\n';
}

void ConsoleSession::reportReveal(const std::optional<game::RevealOutcome>& outcome)
{
    if (!outcome)
    {
        m_out << "Nothing to reveal there.\n";
        return;
    }

    printBoard();

    if (outcome->state == GameState::Lost)
    {
        m_out << "Boom! You hit a mine. Type n for a new game.\n";
    }
    else if (outcome->won)
    {
        m_out << "You cleared the field in " << outcome->elapsedSeconds << " seconds!\n";
        if (outcome->qualifiesForHighScore)
            promptForHighScore();
        m_out << "Type n for a new game.\n";
    }
}

void ConsoleSession::promptForHighScore()
{
    m_out << "New high score! Enter your name: " << std::flush;

    std::string name;
    if (!std::getline(m_in, name))
        name.clear();
    name = Trimmed(std::move(name));
    if (name.empty())
        name = "Anonymous";

    if (m_controller.addHighScore(name))
    {
        spdlog::info("Recorded high score for '{}'", name);
        m_out << RenderScores(m_controller.highScores().getScores());
    }
    else
    {
        m_out << "The score could not be recorded.\n";
    }
}

} // namespace minefield::app
