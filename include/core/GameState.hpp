#pragma once

#include "Board.hpp"
#include "MatchConfig.hpp"
#include "Types.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace blokus::core {

enum class GameStatus {
    Waiting,
    Playing,
    Finished
};

// Outcome of a match action. Anything but Accepted leaves the match untouched.
enum class MoveResult : std::uint8_t {
    Accepted,
    GameNotInProgress,
    NotYourTurn,
    UnknownPiece,
    PieceNotAvailable,
    WrongCellCount,
    InvalidPlacement,
    ValidMovesAvailable // pass refused
};

const char* toString(MoveResult result) noexcept;
const char* toString(GameStatus status) noexcept;

// Authoritative record of one match: board, hands, turn and end detection.
// Every placement is gated on isValidPlacement.
class GameState {
public:
    explicit GameState(MatchConfig config = {});

    const Board& board() const noexcept { return board_; }
    GameStatus status() const noexcept { return status_; }
    PlayerColor currentTurn() const noexcept { return currentTurn_; }
    std::optional<PlayerColor> lastPassedBy() const noexcept { return lastPassedBy_; }
    std::optional<Winner> winner() const noexcept { return winner_; }
    const MatchConfig& config() const noexcept { return config_; }

    const std::vector<int>& remainingPieces(PlayerColor player) const noexcept;
    bool hasPiece(PlayerColor player, int pieceId) const noexcept;
    int score(PlayerColor player) const;
    bool canMove(PlayerColor player) const;

    // Waiting -> Playing
    void start();
    // Back to a fresh Waiting match with the same config
    void reset();

    MoveResult placePiece(PlayerColor player, int pieceId, const CellList& cells);
    MoveResult passTurn(PlayerColor player);

private:
    MatchConfig config_;
    Board board_;
    GameStatus status_{GameStatus::Waiting};
    PlayerColor currentTurn_;
    std::vector<int> bluePieces_;
    std::vector<int> orangePieces_;
    std::optional<PlayerColor> lastPassedBy_;
    std::optional<Winner> winner_;

    std::vector<int>& piecesOf(PlayerColor player) noexcept;
    MoveResult checkTurn(PlayerColor player) const noexcept;
    void advanceTurn(PlayerColor mover);
    void finish();
};

} // namespace blokus::core
