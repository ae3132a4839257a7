#pragma once

#include "Types.hpp"
#include <vector>

namespace blokus::core {

// Cells still in hand; lower is better, 0 is a perfect game.
int calculateScore(const std::vector<int>& remainingPieceIds);

// Lower remaining score wins; equal scores draw.
Winner determineWinner(const std::vector<int>& blueRemaining,
                       const std::vector<int>& orangeRemaining);

} // namespace blokus::core
