#pragma once // Include guard

#include "Types.hpp" // For Cell, CellList
#include <array>     // For std::array
#include <string>
#include <vector>

// Namespace for Blokus core types
namespace blokus::core {

// Immutable piece template. Cells are normalized (min row and col are 0).
struct Piece {
    int id{};
    std::string name;
    int size{};
    CellList cells;
};

using PieceTable = std::array<Piece, PieceCount>;

// The 21 pieces, indexed by id.
const PieceTable& pieceTable();

// Throws std::out_of_range for ids outside [0, PieceCount).
const Piece& pieceById(int id);

bool isValidPieceId(int id) noexcept;

// Distinct orientations of a piece, in stable index order.
std::vector<CellList> orientationsOf(int pieceId);

// Ids 0..20, the starting hand of each player.
std::vector<int> allPieceIds();

} // namespace blokus::core
