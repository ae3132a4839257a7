#pragma once

#include "Board.hpp"
#include "Types.hpp"

#include <optional>
#include <vector>

namespace blokus::core {

// Where one piece lands for one move, and which orientation produced it.
struct Placement {
    CellList cells;
    int orientationIndex{};
};

// Empty squares that share a corner with the player but no edge, in
// row-major order. Before the player's first move: only the starting cell.
std::vector<Cell> findCornerAnchors(const Board& board, PlayerColor player);

// Every valid placement of the piece covering the anchor: each orientation,
// each of its cells pinned to the anchor. Identical cell sets reached from
// different orientation indices are all kept.
std::vector<Placement> findValidPlacementsAtAnchor(const Board& board,
                                                   int pieceId,
                                                   int anchorRow,
                                                   int anchorCol,
                                                   PlayerColor player);

bool canPlacePiece(const Board& board, int pieceId, PlayerColor player);

// False means the player has to pass.
bool hasValidMoves(const Board& board, const std::vector<int>& remainingPieceIds, PlayerColor player);

// Corner anchors at which this piece has at least one placement.
std::vector<Cell> validAnchorsForPiece(const Board& board, int pieceId, PlayerColor player);

// All placements of the piece over all anchors (row-major), each distinct
// cell set once, in first-seen order.
std::vector<Placement> allValidPlacements(const Board& board, int pieceId, PlayerColor player);

// Anchor closest to (row, col) by squared distance; ties go to the earliest.
std::optional<Cell> findNearestValidAnchor(int row, int col, const std::vector<Cell>& anchors);

// Placement whose centroid is closest to the cursor. When a preferred
// orientation is given and present in the list, only those placements compete.
std::optional<Placement> findBestPlacementForCursor(double cursorRow,
                                                    double cursorCol,
                                                    const std::vector<Placement>& placements,
                                                    std::optional<int> preferredOrientation = std::nullopt);

} // namespace blokus::core
