#include "minefield/game/GameController.hpp"

#include "minefield/scores/HighScores.hpp"

#include "core/Rng.h"

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace minefield::game {

namespace {

double SteadySeconds()
{
    using namespace std::chrono;
    return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}

} // namespace

GameController::GameController(int rows, int cols, int mines,
                               scores::HighScoreManager& highScores,
                               std::optional<std::uint64_t> seed,
                               Clock clock)
    : m_board(rows, cols)
    , m_totalMines(mines)
    , m_highScores(highScores)
    , m_seed(seed)
    , m_clock(clock ? std::move(clock) : Clock(&SteadySeconds))
{
    if (mines <= 0 || mines >= m_board.cellCount())
        throw std::invalid_argument("Mine count must be in [1, " + std::to_string(m_board.cellCount() - 1) +
                                    "] for a " + std::to_string(rows) + "x" + std::to_string(cols) +
                                    " board (got " + std::to_string(mines) + ")");

    spdlog::info("GameController: {}x{} board, {} mines{}", rows, cols, mines,
                 seed ? " (seeded)" : "");
}

int GameController::elapsedSeconds() const
{
    switch (m_state)
    {
    case GameState::New:
        return 0;
    case GameState::Won:
    case GameState::Lost:
        return m_elapsedSeconds;
    case GameState::InProgress:
        break;
    }

    const double dt = m_clock() - m_startTime;
    return dt > 0.0 ? static_cast<int>(dt) : 0;
}

bool GameController::acceptsMoves() const noexcept
{
    return m_state == GameState::New || m_state == GameState::InProgress;
}

std::uint64_t GameController::nextLayoutSeed() noexcept
{
    const std::uint64_t index = m_gameIndex++;
    if (m_seed)
        return rng::derive(*m_seed, index);
    return rng::random_seed();
}

void GameController::beginTimer()
{
    m_startTime = m_clock();
    m_elapsedSeconds = 0;
    m_state = GameState::InProgress;
}

bool GameController::startGame()
{
    if (m_state != GameState::New)
        return false;

    if (!m_board.placeMines(m_totalMines, nextLayoutSeed()))
        return false;

    beginTimer();
    spdlog::info("Game started");
    return true;
}

bool GameController::startGameWithMines(const std::vector<CellPos>& mines)
{
    if (m_state != GameState::New)
        return false;

    if (mines.empty() || mines.size() >= static_cast<std::size_t>(m_board.cellCount()))
    {
        spdlog::warn("startGameWithMines: {} mines on {} cells rejected", mines.size(), m_board.cellCount());
        return false;
    }

    if (!m_board.placeMinesAt(mines))
        return false;

    m_totalMines = static_cast<int>(mines.size());
    beginTimer();
    spdlog::info("Game started with a fixed layout of {} mines", m_totalMines);
    return true;
}

void GameController::restartGame()
{
    m_board = Board(m_board.rows(), m_board.cols());
    m_state = GameState::New;
    m_startTime = 0.0;
    m_elapsedSeconds = 0;
    m_flagsPlaced = 0;
    m_scoreRecorded = false;

    spdlog::info("Game restarted");
}

void GameController::finishGame(GameState finalState)
{
    if (m_state != GameState::InProgress)
        return;

    // Freeze before the state flips; elapsedSeconds() stops reading the clock afterwards.
    m_elapsedSeconds = elapsedSeconds();
    m_state = finalState;

    spdlog::info("Game {} after {}s", GameStateName(finalState), m_elapsedSeconds);
}

std::vector<bool> GameController::revealedMask() const
{
    std::vector<bool> mask(static_cast<std::size_t>(m_board.cellCount()), false);
    for (int r = 0; r < m_board.rows(); ++r)
        for (int c = 0; c < m_board.cols(); ++c)
            mask[static_cast<std::size_t>(r * m_board.cols() + c)] = m_board.cell(r, c)->isRevealed();
    return mask;
}

std::vector<RevealedCell> GameController::newlyRevealed(const std::vector<bool>& before) const
{
    std::vector<RevealedCell> out;
    for (int r = 0; r < m_board.rows(); ++r)
    {
        for (int c = 0; c < m_board.cols(); ++c)
        {
            const Cell* cur = m_board.cell(r, c);
            if (cur->isRevealed() && !before[static_cast<std::size_t>(r * m_board.cols() + c)])
                out.push_back(RevealedCell{r, c, cur->isMine(), cur->adjacentMines()});
        }
    }
    return out;
}

void GameController::settleAfterReveal(RevealOutcome& out)
{
    if (m_board.state() == GameState::Lost)
    {
        finishGame(GameState::Lost);
    }
    else if (m_board.allSafeCellsRevealed())
    {
        finishGame(GameState::Won);
        out.qualifiesForHighScore = m_highScores.qualifiesForHighScore(static_cast<double>(m_elapsedSeconds));
        if (out.qualifiesForHighScore)
            spdlog::info("Winning time {}s qualifies for the high score list", m_elapsedSeconds);
    }

    out.state = m_state;
    out.gameOver = IsFinished(m_state);
    out.won = (m_state == GameState::Won);
    out.minesRemaining = remainingMines();
    out.elapsedSeconds = elapsedSeconds();
}

std::optional<RevealOutcome> GameController::revealCell(int row, int col)
{
    if (!acceptsMoves())
        return std::nullopt;

    if (m_state == GameState::New && !startGame())
        return std::nullopt;

    const std::vector<bool> before = revealedMask();
    if (!m_board.revealCell(row, col))
        return std::nullopt;

    RevealOutcome out;
    out.revealedCells = newlyRevealed(before);
    settleAfterReveal(out);
    return out;
}

std::optional<FlagOutcome> GameController::toggleFlag(int row, int col)
{
    if (!acceptsMoves())
        return std::nullopt;

    if (m_state == GameState::New && !startGame())
        return std::nullopt;

    const Cell* target = m_board.cell(row, col);
    if (!target)
        return std::nullopt;

    const bool wasFlagged = target->isFlagged();
    if (!m_board.toggleFlag(row, col))
        return std::nullopt;

    const bool isFlagged = target->isFlagged();
    if (isFlagged != wasFlagged)
        m_flagsPlaced += isFlagged ? 1 : -1;

    FlagOutcome out;
    out.state = m_state;
    out.row = row;
    out.col = col;
    out.isFlagged = isFlagged;
    out.minesRemaining = remainingMines();
    out.elapsedSeconds = elapsedSeconds();
    return out;
}

std::optional<RevealOutcome> GameController::chordReveal(int row, int col)
{
    if (m_state != GameState::InProgress)
        return std::nullopt;

    const Cell* target = m_board.cell(row, col);
    if (!target || !target->isRevealed() || target->adjacentMines() == 0)
        return std::nullopt;

    int flagged = 0;
    std::vector<CellPos> hidden;
    for (const CellPos& p : m_board.neighborPositions(row, col))
    {
        const Cell* n = m_board.cell(p.row, p.col);
        if (n->isFlagged())
            ++flagged;
        else if (!n->isRevealed())
            hidden.push_back(p);
    }

    if (flagged != target->adjacentMines())
        return std::nullopt;

    const std::vector<bool> before = revealedMask();
    for (const CellPos& p : hidden)
    {
        // An earlier flood in this batch may already have opened it.
        if (m_board.cell(p.row, p.col)->isRevealed())
            continue;

        m_board.revealCell(p.row, p.col);
        if (m_board.state() == GameState::Lost)
        {
            spdlog::info("Chord at ({}, {}) hit a mine at ({}, {})", row, col, p.row, p.col);
            break;
        }
    }

    RevealOutcome out;
    out.revealedCells = newlyRevealed(before);
    settleAfterReveal(out);
    return out;
}

bool GameController::addHighScore(const std::string& playerName)
{
    if (m_state != GameState::Won)
    {
        spdlog::warn("addHighScore: game is {}, not won", GameStateName(m_state));
        return false;
    }
    if (m_scoreRecorded)
    {
        spdlog::warn("addHighScore: score for this game already recorded");
        return false;
    }

    m_scoreRecorded = m_highScores.addScore(playerName, static_cast<double>(m_elapsedSeconds));
    return m_scoreRecorded;
}

GameSnapshot GameController::snapshot() const
{
    GameSnapshot s;
    s.rows = m_board.rows();
    s.cols = m_board.cols();
    s.state = m_state;
    s.minesRemaining = remainingMines();
    s.elapsedSeconds = elapsedSeconds();
    s.cells.reserve(static_cast<std::size_t>(m_board.cellCount()));

    for (int r = 0; r < s.rows; ++r)
    {
        for (int c = 0; c < s.cols; ++c)
        {
            const Cell* cur = m_board.cell(r, c);
            s.cells.push_back(CellView{cur->isRevealed(), cur->isFlagged(), cur->isMine(), cur->adjacentMines()});
        }
    }
    return s;
}

} // namespace minefield::game
