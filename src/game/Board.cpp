#include "minefield/game/Board.hpp"

#include "core/Rng.h"

#include <limits>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace minefield::game {

namespace {

constexpr int kNeighborOffsets[8][2] = {
    {-1, -1}, {-1, 0}, {-1, 1},
    { 0, -1},          { 0, 1},
    { 1, -1}, { 1, 0}, { 1, 1},
};

} // namespace

const char* GameStateName(GameState s) noexcept
{
    switch (s)
    {
    case GameState::New:        return "new";
    case GameState::InProgress: return "in_progress";
    case GameState::Won:        return "won";
    case GameState::Lost:       return "lost";
    }
    return "unknown";
}

Board::Board(int rows, int cols)
    : m_rows(rows)
    , m_cols(cols)
{
    if (rows <= 0 || cols <= 0)
        throw std::invalid_argument("Board dimensions must be positive (got " +
                                    std::to_string(rows) + "x" + std::to_string(cols) + ")");
    if (static_cast<long long>(rows) * cols > std::numeric_limits<int>::max())
        throw std::invalid_argument("Board too large (" + std::to_string(rows) + "x" +
                                    std::to_string(cols) + " cells)");

    m_cells.reserve(static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols));
    for (int r = 0; r < rows; ++r)
        for (int c = 0; c < cols; ++c)
            m_cells.emplace_back(r, c);

    spdlog::debug("Board created: {}x{}", rows, cols);
}

bool Board::inBounds(int row, int col) const noexcept
{
    return row >= 0 && col >= 0 && row < m_rows && col < m_cols;
}

const Cell* Board::cell(int row, int col) const noexcept
{
    if (!inBounds(row, col))
        return nullptr;
    return &m_cells[idx(row, col)];
}

Cell* Board::cell(int row, int col) noexcept
{
    if (!inBounds(row, col))
        return nullptr;
    return &m_cells[idx(row, col)];
}

std::vector<CellPos> Board::neighborPositions(int row, int col) const
{
    std::vector<CellPos> out;
    out.reserve(8);
    for (const auto& d : kNeighborOffsets)
    {
        const int r = row + d[0];
        const int c = col + d[1];
        if (inBounds(r, c))
            out.push_back(CellPos{r, c});
    }
    return out;
}

std::vector<const Cell*> Board::neighbors(int row, int col) const
{
    std::vector<const Cell*> out;
    out.reserve(8);
    for (const CellPos& p : neighborPositions(row, col))
        out.push_back(&m_cells[idx(p.row, p.col)]);
    return out;
}

bool Board::placeMines(int count)
{
    return placeMines(count, rng::random_seed());
}

bool Board::placeMines(int count, std::uint64_t seed)
{
    if (m_state != GameState::New)
    {
        spdlog::warn("Board::placeMines: mines already placed (state={})", GameStateName(m_state));
        return false;
    }
    // At least one safe cell, or the board could never be won.
    if (count < 0 || count >= cellCount())
    {
        spdlog::warn("Board::placeMines: invalid mine count {} for {} cells", count, cellCount());
        return false;
    }

    rng::Pcg32 gen(seed);
    const auto picks = rng::sample_distinct(gen,
                                            static_cast<std::uint32_t>(cellCount()),
                                            static_cast<std::uint32_t>(count));
    for (std::uint32_t i : picks)
        m_cells[i].m_mine = true;

    m_mineCount = count;
    computeAdjacency();
    m_state = GameState::InProgress;

    spdlog::debug("Board::placeMines: {} mines on {}x{} (seed={})", count, m_rows, m_cols, seed);
    return true;
}

bool Board::placeMinesAt(const std::vector<CellPos>& positions)
{
    if (m_state != GameState::New)
    {
        spdlog::warn("Board::placeMinesAt: mines already placed (state={})", GameStateName(m_state));
        return false;
    }

    if (positions.size() >= m_cells.size())
    {
        spdlog::warn("Board::placeMinesAt: {} mines leave no safe cell on {} cells",
                     positions.size(), m_cells.size());
        return false;
    }

    std::vector<bool> taken(m_cells.size(), false);
    for (const CellPos& p : positions)
    {
        if (!inBounds(p.row, p.col) || taken[idx(p.row, p.col)])
        {
            spdlog::warn("Board::placeMinesAt: rejected layout at ({}, {})", p.row, p.col);
            return false;
        }
        taken[idx(p.row, p.col)] = true;
    }

    for (const CellPos& p : positions)
        m_cells[idx(p.row, p.col)].m_mine = true;

    m_mineCount = static_cast<int>(positions.size());
    computeAdjacency();
    m_state = GameState::InProgress;
    return true;
}

void Board::computeAdjacency() noexcept
{
    for (int r = 0; r < m_rows; ++r)
    {
        for (int c = 0; c < m_cols; ++c)
        {
            Cell& cur = m_cells[idx(r, c)];
            if (cur.m_mine)
            {
                cur.m_adjacentMines = 0;
                continue;
            }

            std::uint8_t n = 0;
            for (const auto& d : kNeighborOffsets)
            {
                const int nr = r + d[0];
                const int nc = c + d[1];
                if (inBounds(nr, nc) && m_cells[idx(nr, nc)].m_mine)
                    ++n;
            }
            cur.m_adjacentMines = n;
        }
    }
}

bool Board::revealCell(int row, int col)
{
    if (m_state != GameState::InProgress)
        return false;

    Cell* target = cell(row, col);
    if (!target || target->isRevealed() || target->isFlagged())
        return false;

    if (target->reveal())
    {
        m_state = GameState::Lost;
        spdlog::info("Board: mine revealed at ({}, {})", row, col);
        return true;
    }

    if (target->adjacentMines() == 0)
        floodFrom(row, col);

    checkWinCondition();
    return true;
}

void Board::floodFrom(int row, int col)
{
    // Work-list of zero cells whose neighbours still need opening.
    std::vector<CellPos> frontier;
    frontier.push_back(CellPos{row, col});

    while (!frontier.empty())
    {
        const CellPos p = frontier.back();
        frontier.pop_back();

        for (const auto& d : kNeighborOffsets)
        {
            const int nr = p.row + d[0];
            const int nc = p.col + d[1];
            if (!inBounds(nr, nc))
                continue;

            Cell& n = m_cells[idx(nr, nc)];
            if (n.isRevealed() || n.isFlagged())
                continue;

            // Neighbours of a zero cell are never mines.
            n.reveal();
            if (n.adjacentMines() == 0)
                frontier.push_back(CellPos{nr, nc});
        }
    }
}

bool Board::toggleFlag(int row, int col)
{
    Cell* target = cell(row, col);
    if (!target || target->isRevealed())
        return false;
    return target->toggleFlag();
}

bool Board::allSafeCellsRevealed() const noexcept
{
    for (const Cell& c : m_cells)
    {
        if (!c.isMine() && !c.isRevealed())
            return false;
    }
    return true;
}

void Board::checkWinCondition() noexcept
{
    if (m_state == GameState::InProgress && allSafeCellsRevealed())
    {
        m_state = GameState::Won;
        spdlog::info("Board: all safe cells revealed");
    }
}

int Board::flaggedCount() const noexcept
{
    int n = 0;
    for (const Cell& c : m_cells)
        n += c.isFlagged() ? 1 : 0;
    return n;
}

int Board::revealedCount() const noexcept
{
    int n = 0;
    for (const Cell& c : m_cells)
        n += c.isRevealed() ? 1 : 0;
    return n;
}

std::string Board::toString(bool revealMines) const
{
    std::string out;
    out.reserve(static_cast<std::size_t>(m_rows) * static_cast<std::size_t>(m_cols * 2 + 1));

    for (int r = 0; r < m_rows; ++r)
    {
        for (int c = 0; c < m_cols; ++c)
        {
            const Cell& cur = m_cells[idx(r, c)];
            char ch = '.';
            if (cur.isRevealed() || (revealMines && cur.isMine()))
            {
                if (cur.isMine())
                    ch = '*';
                else if (cur.adjacentMines() > 0)
                    ch = static_cast<char>('0' + cur.adjacentMines());
                else
                    ch = ' ';
            }
            else if (cur.isFlagged())
            {
                ch = 'F';
            }

            if (c > 0)
                out.push_back(' ');
            out.push_back(ch);
        }
        if (r + 1 < m_rows)
            out.push_back('\n');
    }
    return out;
}

} // namespace minefield::game
