#pragma once

#include "Types.hpp"
#include <optional>
#include <vector>

namespace blokus::core {

struct BoundingBox {
    int rows{};
    int cols{};
};

// Floating-point centroid of a cell list
struct CellCenter {
    double row{};
    double col{};
};

// Shift cells so that the minimum row and minimum column are both 0.
CellList normalize(const CellList& cells);

// 90 degree turns, result normalized. (r, c) -> (c, -r) for clockwise.
CellList rotateClockwise(const CellList& cells);
CellList rotateCounterClockwise(const CellList& cells);

// Horizontal mirror (r, c) -> (r, -c), result normalized.
CellList reflect(const CellList& cells);

// Distinct orientations of a shape: four clockwise steps from the normalized
// shape, then four from its reflection. Index order never changes.
std::vector<CellList> allOrientations(const CellList& cells);

// Size of the smallest rectangle anchored at the origin enclosing the cells.
BoundingBox boundingBox(const CellList& cells);

CellList translate(const CellList& cells, int dRow, int dCol);

// Same coordinates, ignoring order.
bool cellsEqual(const CellList& a, const CellList& b);

CellCenter cellsCenter(const CellList& cells);

// Index of the orientation matching the normalized cells, if any.
std::optional<int> findOrientationIndex(const std::vector<CellList>& orientations, const CellList& cells);

} // namespace blokus::core
