#pragma once // Include guard

#include <cstdint> // For fixed-width integer types
#include <vector>  // For std::vector

// Namespace for Blokus core types
namespace blokus::core {

// Board dimensions and piece set of the two-player 14x14 variant
constexpr int BoardSize = 14;
constexpr int PieceCount = 21;
constexpr int TotalPieceCells = 89;

// Ring radius used when re-placing a rotated or flipped preview
constexpr int NavigationSearchRadius = 3;

// Cell structure representing a square of the grid (row, col)
struct Cell {
    int row{};
    int col{};
};

inline bool operator==(Cell a, Cell b) noexcept {
    return a.row == b.row && a.col == b.col;
}

inline bool operator!=(Cell a, Cell b) noexcept {
    return !(a == b);
}

// Row-major ordering, so cell lists can be sorted and compared as sets
inline bool operator<(Cell a, Cell b) noexcept {
    return a.row != b.row ? a.row < b.row : a.col < b.col;
}

using CellList = std::vector<Cell>;

// The two players
enum class PlayerColor : std::uint8_t {
    Blue,
    Orange
};

// Value stored in each board square
enum class CellOwner : std::uint8_t {
    Empty  = 0,
    Blue   = 1,
    Orange = 2
};

// Final outcome of a match
enum class Winner : std::uint8_t {
    Blue,
    Orange,
    Draw
};

inline PlayerColor opponentOf(PlayerColor player) noexcept {
    return player == PlayerColor::Blue ? PlayerColor::Orange : PlayerColor::Blue;
}

// Blue -> 1, Orange -> 2
inline CellOwner ownerValue(PlayerColor player) noexcept {
    return player == PlayerColor::Blue ? CellOwner::Blue : CellOwner::Orange;
}

// Fixed first-move square of each player
inline Cell startingCell(PlayerColor player) noexcept {
    return player == PlayerColor::Blue ? Cell{4, 4} : Cell{9, 9};
}

const char* toString(PlayerColor player) noexcept;
const char* toString(Winner winner) noexcept;

} // namespace blokus::core
