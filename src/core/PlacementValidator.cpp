#include "core/PlacementValidator.hpp"

#include <algorithm>

namespace blokus::core {

bool touchesOwnEdge(const Board& board, int row, int col, PlayerColor player) noexcept {
    for (const auto& n : orthogonalNeighbors(row, col)) {
        if (board.isOwnedBy(n.row, n.col, player)) return true;
    }
    return false;
}

bool touchesOwnCorner(const Board& board, int row, int col, PlayerColor player) noexcept {
    for (const auto& n : diagonalNeighbors(row, col)) {
        if (board.isOwnedBy(n.row, n.col, player)) return true;
    }
    return false;
}

bool isValidPlacement(const Board& board, const CellList& cells, PlayerColor player) {
    for (const auto& c : cells) {
        if (!board.isEmpty(c.row, c.col)) {
            return false; // off-grid or occupied
        }
    }

    // Own pieces may never share an edge, whatever the move number
    for (const auto& c : cells) {
        if (touchesOwnEdge(board, c.row, c.col, player)) {
            return false;
        }
    }

    if (!board.hasAnyPiece(player)) {
        const Cell start = startingCell(player);
        return std::find(cells.begin(), cells.end(), start) != cells.end();
    }

    return std::any_of(cells.begin(), cells.end(), [&](const Cell& c) {
        return touchesOwnCorner(board, c.row, c.col, player);
    });
}

} // namespace blokus::core
