#include "core/Piece.hpp"
#include "core/Geometry.hpp"

#include <stdexcept>

namespace blokus::core {

namespace {

PieceTable buildPieceTable() {
    using C = CellList;

    return PieceTable{{
        // [ ]
        {0, "I1", 1, C{{0, 0}}},
        // [ ][ ]
        {1, "I2", 2, C{{0, 0}, {0, 1}}},
        {2, "I3", 3, C{{0, 0}, {0, 1}, {0, 2}}},
        // [ ]
        // [ ][ ]
        {3, "V3", 3, C{{0, 0}, {1, 0}, {1, 1}}},
        {4, "I4", 4, C{{0, 0}, {0, 1}, {0, 2}, {0, 3}}},
        // [ ]
        // [ ]
        // [ ][ ]
        {5, "L4", 4, C{{0, 0}, {1, 0}, {2, 0}, {2, 1}}},
        // [ ][ ][ ]
        //    [ ]
        {6, "T4", 4, C{{0, 0}, {0, 1}, {0, 2}, {1, 1}}},
        {7, "O4", 4, C{{0, 0}, {0, 1}, {1, 0}, {1, 1}}},
        //    [ ][ ]
        // [ ][ ]
        {8, "S4", 4, C{{0, 1}, {0, 2}, {1, 0}, {1, 1}}},
        {9, "I5", 5, C{{0, 0}, {0, 1}, {0, 2}, {0, 3}, {0, 4}}},
        {10, "L5", 5, C{{0, 0}, {1, 0}, {2, 0}, {3, 0}, {3, 1}}},
        {11, "Y5", 5, C{{0, 1}, {1, 0}, {1, 1}, {2, 1}, {3, 1}}},
        {12, "N5", 5, C{{0, 0}, {1, 0}, {1, 1}, {2, 1}, {3, 1}}},
        {13, "P5", 5, C{{0, 0}, {0, 1}, {1, 0}, {1, 1}, {2, 0}}},
        // [ ]   [ ]
        // [ ][ ][ ]
        {14, "U5", 5, C{{0, 0}, {0, 2}, {1, 0}, {1, 1}, {1, 2}}},
        {15, "T5", 5, C{{0, 0}, {0, 1}, {0, 2}, {1, 1}, {2, 1}}},
        {16, "V5", 5, C{{0, 0}, {1, 0}, {2, 0}, {2, 1}, {2, 2}}},
        {17, "W5", 5, C{{0, 0}, {1, 0}, {1, 1}, {2, 1}, {2, 2}}},
        {18, "Z5", 5, C{{0, 0}, {0, 1}, {1, 1}, {2, 1}, {2, 2}}},
        //    [ ][ ]
        // [ ][ ]
        //    [ ]
        {19, "F5", 5, C{{0, 1}, {0, 2}, {1, 0}, {1, 1}, {2, 1}}},
        //    [ ]
        // [ ][ ][ ]
        //    [ ]
        {20, "X5", 5, C{{0, 1}, {1, 0}, {1, 1}, {1, 2}, {2, 1}}},
    }};
}

} // namespace

const PieceTable& pieceTable() {
    static const PieceTable table = buildPieceTable();
    return table;
}

bool isValidPieceId(int id) noexcept {
    return id >= 0 && id < PieceCount;
}

const Piece& pieceById(int id) {
    if (!isValidPieceId(id)) {
        throw std::out_of_range("pieceById: unknown piece id " + std::to_string(id));
    }
    return pieceTable()[static_cast<std::size_t>(id)];
}

std::vector<CellList> orientationsOf(int pieceId) {
    return allOrientations(pieceById(pieceId).cells);
}

std::vector<int> allPieceIds() {
    std::vector<int> ids;
    ids.reserve(PieceCount);
    for (int id = 0; id < PieceCount; ++id) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace blokus::core
