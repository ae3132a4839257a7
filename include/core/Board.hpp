#pragma once

#include "Types.hpp"
#include <array>

namespace blokus::core {

class Board {
public:
    Board() = default;

    static constexpr int rows() noexcept { return BoardSize; }
    static constexpr int cols() noexcept { return BoardSize; }

    CellOwner cell(int row, int col) const;
    CellOwner cell(Cell c) const { return cell(c.row, c.col); }
    void setCell(int row, int col, CellOwner owner);

    // In bounds and unowned. Off-grid squares are never empty.
    bool isEmpty(int row, int col) const noexcept;

    // True if the square is in bounds and owned by the player.
    bool isOwnedBy(int row, int col, PlayerColor player) const noexcept;

    // Distinguishes a player's first move from later ones.
    bool hasAnyPiece(PlayerColor player) const noexcept;

    int countCells(CellOwner owner) const noexcept;

    // Stamp the player's owner value on every cell. Does not validate;
    // callers gate on isValidPlacement. Throws std::out_of_range off-grid.
    void applyPlacement(const CellList& cells, PlayerColor player);

    bool operator==(const Board& other) const noexcept { return grid_ == other.grid_; }
    bool operator!=(const Board& other) const noexcept { return !(*this == other); }

private:
    std::array<CellOwner, BoardSize * BoardSize> grid_{}; // row-major, all Empty

    static int index(int row, int col) noexcept {
        return row * BoardSize + col;
    }
};

bool inBounds(int row, int col) noexcept;

// Edge neighbours (up, down, left, right), not bounds-filtered.
std::array<Cell, 4> orthogonalNeighbors(int row, int col) noexcept;

// Corner neighbours, not bounds-filtered.
std::array<Cell, 4> diagonalNeighbors(int row, int col) noexcept;

} // namespace blokus::core
