#include "minefield/game/Cell.hpp"

namespace minefield::game {

Cell::Cell(int row, int col, bool isMine) noexcept
    : m_pos{row, col}
    , m_mine(isMine)
{
}

bool Cell::reveal() noexcept
{
    if (m_flagged)
        return false;

    m_revealed = true;
    return m_mine;
}

bool Cell::toggleFlag() noexcept
{
    if (m_revealed)
        return false;

    m_flagged = !m_flagged;
    return true;
}

} // namespace minefield::game
