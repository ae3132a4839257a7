#include "core/OrientationNavigator.hpp"
#include "core/Geometry.hpp"
#include "core/Piece.hpp"
#include "core/PlacementValidator.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace blokus::core {

namespace {

// Half-up rounding, so previews land on the same square on every client
int roundHalfUp(double value) {
    return static_cast<int>(std::floor(value + 0.5));
}

bool sharesAnchorCell(const CellList& placed, const std::vector<Cell>& anchorCells) {
    if (anchorCells.empty()) return true;
    return std::any_of(anchorCells.begin(), anchorCells.end(), [&](const Cell& a) {
        return std::find(placed.begin(), placed.end(), a) != placed.end();
    });
}

} // namespace

std::vector<Cell> anchorCellsForPlacement(const Board& board, const CellList& cells, PlayerColor player) {
    std::vector<Cell> anchors;

    if (!board.hasAnyPiece(player)) {
        const Cell start = startingCell(player);
        for (const auto& c : cells) {
            if (c == start) anchors.push_back(c);
        }
        return anchors;
    }

    for (const auto& c : cells) {
        if (touchesOwnCorner(board, c.row, c.col, player)) {
            anchors.push_back(c);
        }
    }
    return anchors;
}

std::optional<CellList> findNearbyValidPosition(const Board& board,
                                                const CellList& orientation,
                                                const CellList& currentCells,
                                                PlayerColor player,
                                                const std::vector<Cell>& anchorCells)
{
    if (currentCells.empty()) return std::nullopt;

    const CellCenter center = cellsCenter(currentCells);
    const int centerRow = roundHalfUp(center.row);
    const int centerCol = roundHalfUp(center.col);

    for (int dist = 0; dist <= NavigationSearchRadius; ++dist) {
        for (int dr = -dist; dr <= dist; ++dr) {
            for (int dc = -dist; dc <= dist; ++dc) {
                if (std::abs(dr) != dist && std::abs(dc) != dist) continue; // ring only

                for (const auto& pinned : orientation) {
                    CellList placed = translate(orientation,
                                                centerRow + dr - pinned.row,
                                                centerCol + dc - pinned.col);
                    if (isValidPlacement(board, placed, player) && sharesAnchorCell(placed, anchorCells)) {
                        return placed;
                    }
                }
            }
        }
    }
    return std::nullopt;
}

std::optional<Placement> nextValidOrientation(const Board& board,
                                              int pieceId,
                                              const CellList& currentCells,
                                              PlayerColor player,
                                              RotationDirection direction)
{
    const auto orientations = orientationsOf(pieceId);
    const auto anchorCells = anchorCellsForPlacement(board, currentCells, player);
    const auto currentIndex = findOrientationIndex(orientations, currentCells);

    if (!currentIndex) {
        // Preview is not one of the canonical shapes: take a single raw step
        const CellList rotated = direction == RotationDirection::Clockwise
            ? rotateClockwise(currentCells)
            : rotateCounterClockwise(currentCells);
        auto cells = findNearbyValidPosition(board, rotated, currentCells, player, anchorCells);
        if (!cells) return std::nullopt;

        const int index = findOrientationIndex(orientations, *cells).value_or(0);
        return Placement{std::move(*cells), index};
    }

    const int count = static_cast<int>(orientations.size());
    for (int step = 1; step <= count; ++step) {
        const int next = direction == RotationDirection::Clockwise
            ? (*currentIndex + step) % count
            : (*currentIndex - step + count) % count;

        auto cells = findNearbyValidPosition(board, orientations[static_cast<std::size_t>(next)],
                                             currentCells, player, anchorCells);
        if (cells) {
            return Placement{std::move(*cells), next};
        }
    }
    return std::nullopt;
}

std::optional<Placement> flippedOrientation(const Board& board,
                                            int pieceId,
                                            const CellList& currentCells,
                                            PlayerColor player)
{
    if (currentCells.empty()) return std::nullopt;

    const auto orientations = orientationsOf(pieceId);
    const auto anchorCells = anchorCellsForPlacement(board, currentCells, player);

    const CellList flipped = reflect(normalize(currentCells));

    // Re-centre the mirrored shape on the current centroid
    const CellCenter currentCenter = cellsCenter(currentCells);
    const CellCenter flippedCenter = cellsCenter(flipped);
    CellList centred = translate(flipped,
                                 roundHalfUp(currentCenter.row - flippedCenter.row),
                                 roundHalfUp(currentCenter.col - flippedCenter.col));

    if (isValidPlacement(board, centred, player) && sharesAnchorCell(centred, anchorCells)) {
        const int index = findOrientationIndex(orientations, centred).value_or(0);
        return Placement{std::move(centred), index};
    }

    auto cells = findNearbyValidPosition(board, flipped, currentCells, player, anchorCells);
    if (!cells) return std::nullopt;

    const int index = findOrientationIndex(orientations, *cells).value_or(0);
    return Placement{std::move(*cells), index};
}

} // namespace blokus::core
