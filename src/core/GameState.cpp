#include "core/GameState.hpp"
#include "core/MoveGenerator.hpp"
#include "core/Piece.hpp"
#include "core/PlacementValidator.hpp"
#include "core/Scoring.hpp"

#include <algorithm>

namespace blokus::core {

const char* toString(MoveResult result) noexcept {
    switch (result) {
    case MoveResult::Accepted:            return "Accepted";
    case MoveResult::GameNotInProgress:   return "Game is not in progress";
    case MoveResult::NotYourTurn:         return "Not your turn";
    case MoveResult::UnknownPiece:        return "Unknown piece";
    case MoveResult::PieceNotAvailable:   return "Piece not available";
    case MoveResult::WrongCellCount:      return "Invalid cell count for piece";
    case MoveResult::InvalidPlacement:    return "Invalid move, try another orientation or anchor";
    case MoveResult::ValidMovesAvailable: return "You have valid moves available";
    }
    return "Unknown result";
}

const char* toString(GameStatus status) noexcept {
    switch (status) {
    case GameStatus::Waiting:  return "Waiting";
    case GameStatus::Playing:  return "Playing";
    case GameStatus::Finished: return "Finished";
    }
    return "Unknown";
}

GameState::GameState(MatchConfig config)
    : config_{config}
    , board_{}
    , status_{GameStatus::Waiting}
    , currentTurn_{config.firstPlayer}
    , bluePieces_{allPieceIds()}
    , orangePieces_{allPieceIds()}
    , lastPassedBy_{}
    , winner_{}
{
}

const std::vector<int>& GameState::remainingPieces(PlayerColor player) const noexcept {
    return player == PlayerColor::Blue ? bluePieces_ : orangePieces_;
}

std::vector<int>& GameState::piecesOf(PlayerColor player) noexcept {
    return player == PlayerColor::Blue ? bluePieces_ : orangePieces_;
}

bool GameState::hasPiece(PlayerColor player, int pieceId) const noexcept {
    const auto& pieces = remainingPieces(player);
    return std::find(pieces.begin(), pieces.end(), pieceId) != pieces.end();
}

int GameState::score(PlayerColor player) const {
    return calculateScore(remainingPieces(player));
}

bool GameState::canMove(PlayerColor player) const {
    return hasValidMoves(board_, remainingPieces(player), player);
}

void GameState::start() {
    if (status_ != GameStatus::Waiting) return;

    status_ = GameStatus::Playing;
    currentTurn_ = config_.firstPlayer;
}

void GameState::reset() {
    board_ = Board{};
    status_ = GameStatus::Waiting;
    currentTurn_ = config_.firstPlayer;
    bluePieces_ = allPieceIds();
    orangePieces_ = allPieceIds();
    lastPassedBy_.reset();
    winner_.reset();
}

MoveResult GameState::checkTurn(PlayerColor player) const noexcept {
    if (status_ != GameStatus::Playing) return MoveResult::GameNotInProgress;
    if (currentTurn_ != player) return MoveResult::NotYourTurn;
    return MoveResult::Accepted;
}

MoveResult GameState::placePiece(PlayerColor player, int pieceId, const CellList& cells) {
    const MoveResult turn = checkTurn(player);
    if (turn != MoveResult::Accepted) return turn;

    if (!isValidPieceId(pieceId)) return MoveResult::UnknownPiece;
    if (!hasPiece(player, pieceId)) return MoveResult::PieceNotAvailable;

    if (static_cast<int>(cells.size()) != pieceById(pieceId).size) {
        return MoveResult::WrongCellCount;
    }

    if (!isValidPlacement(board_, cells, player)) {
        return MoveResult::InvalidPlacement;
    }

    board_.applyPlacement(cells, player);

    auto& pieces = piecesOf(player);
    pieces.erase(std::remove(pieces.begin(), pieces.end(), pieceId), pieces.end());

    lastPassedBy_.reset();
    advanceTurn(player);
    return MoveResult::Accepted;
}

MoveResult GameState::passTurn(PlayerColor player) {
    const MoveResult turn = checkTurn(player);
    if (turn != MoveResult::Accepted) return turn;

    if (canMove(player)) return MoveResult::ValidMovesAvailable;

    const PlayerColor next = opponentOf(player);

    // Second consecutive pass ends the match
    if (lastPassedBy_ == next) {
        currentTurn_ = next;
        finish();
        return MoveResult::Accepted;
    }

    currentTurn_ = next;
    lastPassedBy_ = player;

    if (config_.autoPass && !canMove(next)) {
        finish();
    }
    return MoveResult::Accepted;
}

void GameState::advanceTurn(PlayerColor mover) {
    const PlayerColor next = opponentOf(mover);

    const bool nextCanMove  = canMove(next);
    const bool moverCanMove = canMove(mover);

    if (!nextCanMove && !moverCanMove) {
        currentTurn_ = next;
        finish();
        return;
    }

    if (config_.autoPass && !nextCanMove) {
        // Opponent is stuck: record the pass and hand the turn straight back
        lastPassedBy_ = next;
        currentTurn_ = mover;
        return;
    }

    currentTurn_ = next;
}

void GameState::finish() {
    status_ = GameStatus::Finished;
    winner_ = determineWinner(bluePieces_, orangePieces_);
}

} // namespace blokus::core
