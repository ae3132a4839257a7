#include "core/Geometry.hpp"

#include <algorithm>
#include <cstddef>

namespace blokus::core {

CellList normalize(const CellList& cells) {
    if (cells.empty()) return {};

    int minRow = cells.front().row;
    int minCol = cells.front().col;
    for (const auto& c : cells) {
        minRow = std::min(minRow, c.row);
        minCol = std::min(minCol, c.col);
    }
    return translate(cells, -minRow, -minCol);
}

CellList rotateClockwise(const CellList& cells) {
    CellList rotated;
    rotated.reserve(cells.size());
    for (const auto& c : cells) {
        rotated.push_back(Cell{c.col, -c.row});
    }
    return normalize(rotated);
}

CellList rotateCounterClockwise(const CellList& cells) {
    CellList rotated;
    rotated.reserve(cells.size());
    for (const auto& c : cells) {
        rotated.push_back(Cell{-c.col, c.row});
    }
    return normalize(rotated);
}

CellList reflect(const CellList& cells) {
    CellList mirrored;
    mirrored.reserve(cells.size());
    for (const auto& c : cells) {
        mirrored.push_back(Cell{c.row, -c.col});
    }
    return normalize(mirrored);
}

std::vector<CellList> allOrientations(const CellList& cells) {
    std::vector<CellList> orientations;
    if (cells.empty()) return orientations;
    orientations.reserve(8);

    CellList current = normalize(cells);
    for (int flip = 0; flip < 2; ++flip) {
        for (int rot = 0; rot < 4; ++rot) {
            const bool seen = std::any_of(
                orientations.begin(), orientations.end(),
                [&](const CellList& o) { return cellsEqual(o, current); });
            if (!seen) {
                orientations.push_back(current);
            }
            current = rotateClockwise(current);
        }
        // Second pass starts again from the mirror of the base shape
        current = reflect(cells);
    }
    return orientations;
}

BoundingBox boundingBox(const CellList& cells) {
    BoundingBox box{};
    for (const auto& c : normalize(cells)) {
        box.rows = std::max(box.rows, c.row + 1);
        box.cols = std::max(box.cols, c.col + 1);
    }
    return box;
}

CellList translate(const CellList& cells, int dRow, int dCol) {
    CellList moved;
    moved.reserve(cells.size());
    for (const auto& c : cells) {
        moved.push_back(Cell{c.row + dRow, c.col + dCol});
    }
    return moved;
}

bool cellsEqual(const CellList& a, const CellList& b) {
    if (a.size() != b.size()) return false;

    CellList sortedA = a;
    CellList sortedB = b;
    std::sort(sortedA.begin(), sortedA.end());
    std::sort(sortedB.begin(), sortedB.end());
    return sortedA == sortedB;
}

CellCenter cellsCenter(const CellList& cells) {
    if (cells.empty()) return {};

    double sumRow = 0.0;
    double sumCol = 0.0;
    for (const auto& c : cells) {
        sumRow += c.row;
        sumCol += c.col;
    }
    const auto n = static_cast<double>(cells.size());
    return CellCenter{sumRow / n, sumCol / n};
}

std::optional<int> findOrientationIndex(const std::vector<CellList>& orientations,
                                        const CellList& cells)
{
    const CellList shape = normalize(cells);
    for (std::size_t i = 0; i < orientations.size(); ++i) {
        if (cellsEqual(orientations[i], shape)) {
            return static_cast<int>(i);
        }
    }
    return std::nullopt;
}

} // namespace blokus::core
