#pragma once

#include "Board.hpp"
#include "MoveGenerator.hpp"
#include "Types.hpp"

#include <optional>
#include <vector>

namespace blokus::core {

enum class RotationDirection {
    Clockwise,
    CounterClockwise
};

// Cells of a placement that connect it to the player's network: the starting
// cell on a first move, otherwise every cell corner-adjacent to the player.
std::vector<Cell> anchorCellsForPlacement(const Board& board, const CellList& cells, PlayerColor player);

// Search rings of radius 0..NavigationSearchRadius around the rounded
// centroid of `currentCells` for a valid translation of `orientation` that
// covers one of `anchorCells` (no constraint when the list is empty).
std::optional<CellList> findNearbyValidPosition(const Board& board,
                                                const CellList& orientation,
                                                const CellList& currentCells,
                                                PlayerColor player,
                                                const std::vector<Cell>& anchorCells);

// Next orientation index (wrapping, in `direction`) that can be placed near
// the current preview without leaving its anchor. std::nullopt when the
// whole cycle has nothing.
std::optional<Placement> nextValidOrientation(const Board& board,
                                              int pieceId,
                                              const CellList& currentCells,
                                              PlayerColor player,
                                              RotationDirection direction);

// Mirror image of the current preview, kept centred where possible.
std::optional<Placement> flippedOrientation(const Board& board,
                                            int pieceId,
                                            const CellList& currentCells,
                                            PlayerColor player);

} // namespace blokus::core
