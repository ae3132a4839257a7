#include "core/Types.hpp"

namespace blokus::core {

const char* toString(PlayerColor player) noexcept {
    switch (player) {
    case PlayerColor::Blue:   return "blue";
    case PlayerColor::Orange: return "orange";
    }
    return "unknown";
}

const char* toString(Winner winner) noexcept {
    switch (winner) {
    case Winner::Blue:   return "blue";
    case Winner::Orange: return "orange";
    case Winner::Draw:   return "draw";
    }
    return "unknown";
}

} // namespace blokus::core
