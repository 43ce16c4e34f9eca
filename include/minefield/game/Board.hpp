#pragma once
// include/minefield/game/Board.hpp
//
// Row-major grid of Cells plus the board-level state machine:
//
//   New --placeMines--> InProgress --reveal mine--> Lost
//                       InProgress --all safe cells revealed--> Won
//
// Won and Lost are terminal. A finished board is never reset; the owner
// replaces it with a fresh instance.

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "minefield/game/Cell.hpp"

namespace minefield::game {

enum class GameState : std::uint8_t {
    New = 0,
    InProgress,
    Won,
    Lost,
};

// "new", "in_progress", "won", "lost"
[[nodiscard]] const char* GameStateName(GameState s) noexcept;

[[nodiscard]] inline bool IsFinished(GameState s) noexcept
{
    return s == GameState::Won || s == GameState::Lost;
}

class Board {
public:
    // Throws std::invalid_argument unless rows > 0, cols > 0 and rows * cols
    // fits in an int.
    Board(int rows, int cols);

    [[nodiscard]] int rows() const noexcept { return m_rows; }
    [[nodiscard]] int cols() const noexcept { return m_cols; }
    [[nodiscard]] int cellCount() const noexcept { return m_rows * m_cols; }

    [[nodiscard]] GameState state() const noexcept { return m_state; }
    [[nodiscard]] int mineCount() const noexcept { return m_mineCount; }

    [[nodiscard]] bool inBounds(int row, int col) const noexcept;

    // nullptr when (row, col) is outside the grid.
    [[nodiscard]] const Cell* cell(int row, int col) const noexcept;
    [[nodiscard]] Cell* cell(int row, int col) noexcept;

    // Existing cells at the 8 surrounding offsets (corner: 3, edge: 5, interior: 8).
    [[nodiscard]] std::vector<const Cell*> neighbors(int row, int col) const;
    [[nodiscard]] std::vector<CellPos> neighborPositions(int row, int col) const;

    // ------------------------------------------------------------
    // Mine placement (once per board)
    // ------------------------------------------------------------
    // Picks `count` distinct cells uniformly at random, computes adjacency,
    // and moves the board to InProgress.
    //
    // Returns false without touching the grid if mines were already placed
    // or count is outside [0, cellCount() - 1].
    bool placeMines(int count, std::uint64_t seed);
    bool placeMines(int count);

    // Deterministic layout for replays and tests. Duplicate or out-of-bounds
    // positions, or a layout with no safe cell, are rejected as a whole.
    bool placeMinesAt(const std::vector<CellPos>& positions);

    // ------------------------------------------------------------
    // Player actions
    // ------------------------------------------------------------
    // Reveals (row, col). Returns false when out of bounds, already revealed,
    // flagged, or the board is not InProgress.
    //
    // A mine ends the game immediately. A zero cell flood-fills: every
    // unrevealed, unflagged neighbour is revealed and zero neighbours expand
    // further, so the region stops at numbered cells and flags.
    bool revealCell(int row, int col);

    // Returns false when out of bounds or already revealed.
    bool toggleFlag(int row, int col);

    // Win predicate: every non-mine cell revealed. Flags are irrelevant.
    [[nodiscard]] bool allSafeCellsRevealed() const noexcept;

    [[nodiscard]] int flaggedCount() const noexcept;
    [[nodiscard]] int revealedCount() const noexcept;

    // Debug dump: '.' hidden, 'F' flag, '*' mine, ' ' empty, digit otherwise.
    // With revealMines, hidden mines are drawn as '*' too.
    [[nodiscard]] std::string toString(bool revealMines = false) const;

private:
    [[nodiscard]] std::size_t idx(int row, int col) const noexcept
    {
        return static_cast<std::size_t>(row * m_cols + col);
    }

    void computeAdjacency() noexcept;
    void floodFrom(int row, int col);
    void checkWinCondition() noexcept;

    int               m_rows = 0;
    int               m_cols = 0;
    int               m_mineCount = 0;
    GameState         m_state = GameState::New;
    std::vector<Cell> m_cells;
};

} // namespace minefield::game
