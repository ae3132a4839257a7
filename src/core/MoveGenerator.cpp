#include "core/MoveGenerator.hpp"
#include "core/Geometry.hpp"
#include "core/Piece.hpp"
#include "core/PlacementValidator.hpp"

#include <algorithm>
#include <limits>
#include <set>
#include <utility>

namespace blokus::core {

std::vector<Cell> findCornerAnchors(const Board& board, PlayerColor player) {
    if (!board.hasAnyPiece(player)) {
        return {startingCell(player)};
    }

    std::vector<Cell> anchors;
    for (int r = 0; r < BoardSize; ++r) {
        for (int c = 0; c < BoardSize; ++c) {
            if (!board.isEmpty(r, c)) continue;
            if (!touchesOwnCorner(board, r, c, player)) continue;
            if (touchesOwnEdge(board, r, c, player)) continue;
            anchors.push_back(Cell{r, c});
        }
    }
    return anchors;
}

std::vector<Placement> findValidPlacementsAtAnchor(const Board& board,
                                                   int pieceId,
                                                   int anchorRow,
                                                   int anchorCol,
                                                   PlayerColor player)
{
    const auto orientations = orientationsOf(pieceId);
    std::vector<Placement> placements;

    for (std::size_t oi = 0; oi < orientations.size(); ++oi) {
        const CellList& orientation = orientations[oi];
        for (const auto& pinned : orientation) {
            CellList placed = translate(orientation, anchorRow - pinned.row, anchorCol - pinned.col);
            if (isValidPlacement(board, placed, player)) {
                placements.push_back(Placement{std::move(placed), static_cast<int>(oi)});
            }
        }
    }
    return placements;
}

bool canPlacePiece(const Board& board, int pieceId, PlayerColor player) {
    const auto orientations = orientationsOf(pieceId);

    for (const auto& anchor : findCornerAnchors(board, player)) {
        for (const auto& orientation : orientations) {
            for (const auto& pinned : orientation) {
                const CellList placed =
                    translate(orientation, anchor.row - pinned.row, anchor.col - pinned.col);
                if (isValidPlacement(board, placed, player)) return true;
            }
        }
    }
    return false;
}

bool hasValidMoves(const Board& board, const std::vector<int>& remainingPieceIds, PlayerColor player) {
    return std::any_of(remainingPieceIds.begin(), remainingPieceIds.end(),
                       [&](int pieceId) { return canPlacePiece(board, pieceId, player); });
}

std::vector<Cell> validAnchorsForPiece(const Board& board, int pieceId, PlayerColor player) {
    std::vector<Cell> anchors;
    for (const auto& anchor : findCornerAnchors(board, player)) {
        if (!findValidPlacementsAtAnchor(board, pieceId, anchor.row, anchor.col, player).empty()) {
            anchors.push_back(anchor);
        }
    }
    return anchors;
}

std::vector<Placement> allValidPlacements(const Board& board, int pieceId, PlayerColor player) {
    std::vector<Placement> result;
    std::set<CellList> seen; // sorted cell lists

    for (const auto& anchor : findCornerAnchors(board, player)) {
        for (auto& placement : findValidPlacementsAtAnchor(board, pieceId, anchor.row, anchor.col, player)) {
            CellList key = placement.cells;
            std::sort(key.begin(), key.end());
            if (seen.insert(std::move(key)).second) {
                result.push_back(std::move(placement));
            }
        }
    }
    return result;
}

std::optional<Cell> findNearestValidAnchor(int row, int col, const std::vector<Cell>& anchors) {
    std::optional<Cell> nearest;
    int minDist = std::numeric_limits<int>::max();

    for (const auto& a : anchors) {
        const int dr = a.row - row;
        const int dc = a.col - col;
        const int dist = dr * dr + dc * dc;
        if (dist < minDist) {
            minDist = dist;
            nearest = a;
        }
    }
    return nearest;
}

std::optional<Placement> findBestPlacementForCursor(double cursorRow,
                                                    double cursorCol,
                                                    const std::vector<Placement>& placements,
                                                    std::optional<int> preferredOrientation)
{
    if (placements.empty()) return std::nullopt;

    // Stick with the current orientation when it can land here at all
    bool usePreferred = false;
    if (preferredOrientation) {
        usePreferred = std::any_of(placements.begin(), placements.end(), [&](const Placement& p) {
            return p.orientationIndex == *preferredOrientation;
        });
    }

    const Placement* best = nullptr;
    double minDist = std::numeric_limits<double>::infinity();

    for (const auto& p : placements) {
        if (usePreferred && p.orientationIndex != *preferredOrientation) continue;

        const CellCenter center = cellsCenter(p.cells);
        const double dr = center.row - cursorRow;
        const double dc = center.col - cursorCol;
        const double dist = dr * dr + dc * dc;
        if (dist < minDist) {
            minDist = dist;
            best = &p;
        }
    }

    if (!best) return std::nullopt;
    return *best;
}

} // namespace blokus::core
