#pragma once

#include "core/Types.hpp" // for PlayerColor

namespace blokus::core {

struct MatchConfig {
    PlayerColor firstPlayer{PlayerColor::Blue}; // who opens the match
    bool autoPass{false};                       // pass automatically for a player with no legal move
};

} // namespace blokus::core
