#pragma once

#include "Board.hpp"
#include "Types.hpp"

namespace blokus::core {

// Legality of a placement for `player`:
//  1. every cell in bounds and empty
//  2. no cell edge-adjacent to one of the player's own cells
//  3. first move: some cell is the player's starting cell
//  4. later moves: some cell is corner-adjacent to one of the player's cells
// Every match mutation and every preview goes through this predicate.
bool isValidPlacement(const Board& board, const CellList& cells, PlayerColor player);

// Rule 2 on its own: true if (row, col) shares an edge with the player.
bool touchesOwnEdge(const Board& board, int row, int col, PlayerColor player) noexcept;

// True if (row, col) shares a corner with the player.
bool touchesOwnCorner(const Board& board, int row, int col, PlayerColor player) noexcept;

} // namespace blokus::core
