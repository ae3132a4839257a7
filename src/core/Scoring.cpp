#include "core/Scoring.hpp"
#include "core/Piece.hpp"

namespace blokus::core {

int calculateScore(const std::vector<int>& remainingPieceIds) {
    int score = 0;
    for (const int id : remainingPieceIds) {
        score += pieceById(id).size;
    }
    return score;
}

Winner determineWinner(const std::vector<int>& blueRemaining,
                       const std::vector<int>& orangeRemaining)
{
    const int blueScore   = calculateScore(blueRemaining);
    const int orangeScore = calculateScore(orangeRemaining);

    if (blueScore < orangeScore) return Winner::Blue;
    if (orangeScore < blueScore) return Winner::Orange;
    return Winner::Draw;
}

} // namespace blokus::core
