#pragma once
// include/minefield/game/Cell.hpp
//
// One square of the minefield grid.
//
// A cell never changes position. Its mine flag and adjacency count are written
// once by the owning Board during mine placement; the player-facing state
// (revealed / flagged) is mutated through reveal() and toggleFlag().

#include <cstdint>

namespace minefield::game {

struct CellPos {
    int row = 0;
    int col = 0;

    friend bool operator==(const CellPos& a, const CellPos& b) noexcept
    {
        return a.row == b.row && a.col == b.col;
    }
    friend bool operator!=(const CellPos& a, const CellPos& b) noexcept { return !(a == b); }
};

class Cell {
public:
    Cell() = default;
    Cell(int row, int col, bool isMine = false) noexcept;

    [[nodiscard]] int row() const noexcept { return m_pos.row; }
    [[nodiscard]] int col() const noexcept { return m_pos.col; }
    [[nodiscard]] CellPos position() const noexcept { return m_pos; }

    [[nodiscard]] bool isMine() const noexcept { return m_mine; }
    [[nodiscard]] bool isRevealed() const noexcept { return m_revealed; }
    [[nodiscard]] bool isFlagged() const noexcept { return m_flagged; }

    // 0..8. Only meaningful for non-mine cells after mine placement.
    [[nodiscard]] int adjacentMines() const noexcept { return m_adjacentMines; }

    // Reveals the cell and returns true if it is a mine.
    // A flagged cell is left untouched and false is returned.
    //
    // Not idempotent in aggregate flows: callers check isRevealed() first.
    bool reveal() noexcept;

    // Flips the flag marker. Returns false (no change) once revealed.
    bool toggleFlag() noexcept;

private:
    friend class Board;

    CellPos      m_pos{};
    bool         m_mine = false;
    bool         m_revealed = false;
    bool         m_flagged = false;
    std::uint8_t m_adjacentMines = 0;
};

} // namespace minefield::game
