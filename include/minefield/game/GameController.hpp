#pragma once
// include/minefield/game/GameController.hpp
//
// One play session on top of a Board: timer, flag counter, chorded reveal,
// state transitions and the hand-off of winning times to the leaderboard.
//
// The controller owns its Board exclusively and only hands out a const view,
// so the flag counter it keeps can never drift from the grid.

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "minefield/game/Board.hpp"
#include "minefield/game/Cell.hpp"

namespace minefield::scores { class HighScoreManager; }

namespace minefield::game {

struct RevealedCell {
    int  row = 0;
    int  col = 0;
    bool isMine = false;
    int  adjacentMines = 0;
};

// Result of revealCell / chordReveal.
struct RevealOutcome {
    GameState                 state = GameState::New;
    std::vector<RevealedCell> revealedCells; // cells that became revealed by this move
    int                       minesRemaining = 0;
    int                       elapsedSeconds = 0;
    bool                      gameOver = false;
    bool                      won = false;
    bool                      qualifiesForHighScore = false; // only set on the winning move
};

// Result of toggleFlag.
struct FlagOutcome {
    GameState state = GameState::New;
    int       row = 0;
    int       col = 0;
    bool      isFlagged = false;
    int       minesRemaining = 0;
    int       elapsedSeconds = 0;
};

// Read-only copy of a cell for presentation code.
struct CellView {
    bool isRevealed = false;
    bool isFlagged = false;
    bool isMine = false;
    int  adjacentMines = 0;
};

struct GameSnapshot {
    int                   rows = 0;
    int                   cols = 0;
    GameState             state = GameState::New;
    int                   minesRemaining = 0;
    int                   elapsedSeconds = 0;
    std::vector<CellView> cells; // row-major

    [[nodiscard]] const CellView& at(int row, int col) const
    {
        return cells[static_cast<std::size_t>(row * cols + col)];
    }
};

class GameController {
public:
    // Monotonic time source in seconds. Tests inject a fake one.
    using Clock = std::function<double()>;

    // Throws std::invalid_argument unless rows, cols and mines are positive
    // and mines < rows * cols.
    //
    // With a seed, game N of the session uses a layout derived from (seed, N),
    // so a seeded session replays identically.
    GameController(int rows, int cols, int mines,
                   scores::HighScoreManager& highScores,
                   std::optional<std::uint64_t> seed = std::nullopt,
                   Clock clock = {});

    [[nodiscard]] GameState state() const noexcept { return m_state; }
    [[nodiscard]] const Board& board() const noexcept { return m_board; }
    [[nodiscard]] const Cell* cell(int row, int col) const noexcept { return m_board.cell(row, col); }

    [[nodiscard]] int rows() const noexcept { return m_board.rows(); }
    [[nodiscard]] int cols() const noexcept { return m_board.cols(); }
    [[nodiscard]] int totalMines() const noexcept { return m_totalMines; }
    [[nodiscard]] int flagsPlaced() const noexcept { return m_flagsPlaced; }

    // total - flags; negative when over-flagged.
    [[nodiscard]] int remainingMines() const noexcept { return m_totalMines - m_flagsPlaced; }

    // 0 while New, frozen once Won/Lost, live otherwise.
    [[nodiscard]] int elapsedSeconds() const;

    // ------------------------------------------------------------
    // Session lifecycle
    // ------------------------------------------------------------
    // Places mines and starts the timer. Only acts while New; returns false
    // (no re-placement, no timer reset) otherwise.
    bool startGame();

    // startGame with a fixed layout. `mines.size()` becomes the mine total and
    // must be in [1, rows * cols - 1].
    bool startGameWithMines(const std::vector<CellPos>& mines);

    // Fresh board with the same dimensions and mine count. Mines are placed
    // lazily by the first move.
    void restartGame();

    // ------------------------------------------------------------
    // Moves (only while New or InProgress; the first move starts the game)
    // ------------------------------------------------------------
    std::optional<RevealOutcome> revealCell(int row, int col);
    std::optional<FlagOutcome>   toggleFlag(int row, int col);

    // Opens every hidden, unflagged neighbour of a revealed number once the
    // number of flagged neighbours matches it. Absent when the move does not
    // apply; a wrong flag makes the batch hit a mine and lose.
    std::optional<RevealOutcome> chordReveal(int row, int col);

    // ------------------------------------------------------------
    // Leaderboard
    // ------------------------------------------------------------
    // Records the frozen time of a won game, once. False otherwise.
    bool addHighScore(const std::string& playerName);

    [[nodiscard]] scores::HighScoreManager& highScores() noexcept { return m_highScores; }

    [[nodiscard]] GameSnapshot snapshot() const;

private:
    [[nodiscard]] bool acceptsMoves() const noexcept;
    [[nodiscard]] std::uint64_t nextLayoutSeed() noexcept;
    void beginTimer();
    void finishGame(GameState finalState);

    [[nodiscard]] std::vector<bool> revealedMask() const;
    [[nodiscard]] std::vector<RevealedCell> newlyRevealed(const std::vector<bool>& before) const;

    // Promotes Lost/Won from the board after a batch of reveals and fills
    // the state fields of `out`.
    void settleAfterReveal(RevealOutcome& out);

    Board                        m_board;
    GameState                    m_state = GameState::New;
    int                          m_totalMines = 0;
    int                          m_flagsPlaced = 0;
    double                       m_startTime = 0.0;
    int                          m_elapsedSeconds = 0;
    bool                         m_scoreRecorded = false;

    scores::HighScoreManager&    m_highScores;
    std::optional<std::uint64_t> m_seed;
    std::uint64_t                m_gameIndex = 0;
    Clock                        m_clock;
};

} // namespace minefield::game
