#include "core/Board.hpp"
#include <stdexcept>

namespace blokus::core {

bool inBounds(int row, int col) noexcept {
    return row >= 0 && row < BoardSize && col >= 0 && col < BoardSize;
}

std::array<Cell, 4> orthogonalNeighbors(int row, int col) noexcept {
    return {{
        {row - 1, col},
        {row + 1, col},
        {row, col - 1},
        {row, col + 1}
    }};
}

std::array<Cell, 4> diagonalNeighbors(int row, int col) noexcept {
    return {{
        {row - 1, col - 1},
        {row - 1, col + 1},
        {row + 1, col - 1},
        {row + 1, col + 1}
    }};
}

CellOwner Board::cell(int row, int col) const {
    if (!inBounds(row, col)) {
        throw std::out_of_range("Board::cell out of range");
    }
    return grid_[index(row, col)];
}

void Board::setCell(int row, int col, CellOwner owner) {
    if (!inBounds(row, col)) {
        throw std::out_of_range("Board::setCell out of range");
    }
    grid_[index(row, col)] = owner;
}

bool Board::isEmpty(int row, int col) const noexcept {
    return inBounds(row, col) && grid_[index(row, col)] == CellOwner::Empty;
}

bool Board::isOwnedBy(int row, int col, PlayerColor player) const noexcept {
    return inBounds(row, col) && grid_[index(row, col)] == ownerValue(player);
}

bool Board::hasAnyPiece(PlayerColor player) const noexcept {
    const CellOwner value = ownerValue(player);
    for (const auto owner : grid_) {
        if (owner == value) return true;
    }
    return false;
}

int Board::countCells(CellOwner owner) const noexcept {
    int count = 0;
    for (const auto value : grid_) {
        if (value == owner) ++count;
    }
    return count;
}

void Board::applyPlacement(const CellList& cells, PlayerColor player) {
    // Check everything first so a bad list leaves the board untouched
    for (const auto& c : cells) {
        if (!inBounds(c.row, c.col)) {
            throw std::out_of_range("Board::applyPlacement out of range");
        }
    }

    const CellOwner value = ownerValue(player);
    for (const auto& c : cells) {
        grid_[index(c.row, c.col)] = value;
    }
}

} // namespace blokus::core
