#include <catch2/catch.hpp>

#include "core/GameState.hpp"
#include "core/MatchConfig.hpp"
#include "core/Types.hpp"

#include <string>

using namespace blokus::core;

TEST_CASE("GameState: fresh match waits with full hands", "[game_state]") {
    GameState game;

    REQUIRE(game.status() == GameStatus::Waiting);
    REQUIRE(game.currentTurn() == PlayerColor::Blue);
    REQUIRE(game.remainingPieces(PlayerColor::Blue).size() == 21);
    REQUIRE(game.remainingPieces(PlayerColor::Orange).size() == 21);
    REQUIRE(game.score(PlayerColor::Blue) == 89);
    REQUIRE_FALSE(game.winner().has_value());
    REQUIRE_FALSE(game.lastPassedBy().has_value());

    // Nothing is accepted before the match starts
    REQUIRE(game.placePiece(PlayerColor::Blue, 0, CellList{{4, 4}}) == MoveResult::GameNotInProgress);
    REQUIRE(game.passTurn(PlayerColor::Blue) == MoveResult::GameNotInProgress);
    REQUIRE(game.board().cell(4, 4) == CellOwner::Empty);

    game.start();
    REQUIRE(game.status() == GameStatus::Playing);
}

TEST_CASE("GameState: accepted placement updates board, hand and turn", "[game_state]") {
    GameState game;
    game.start();

    REQUIRE(game.placePiece(PlayerColor::Blue, 0, CellList{{4, 4}}) == MoveResult::Accepted);

    REQUIRE(game.board().cell(4, 4) == CellOwner::Blue);
    REQUIRE_FALSE(game.hasPiece(PlayerColor::Blue, 0));
    REQUIRE(game.hasPiece(PlayerColor::Orange, 0));
    REQUIRE(game.remainingPieces(PlayerColor::Blue).size() == 20);
    REQUIRE(game.score(PlayerColor::Blue) == 88);
    REQUIRE(game.currentTurn() == PlayerColor::Orange);
    REQUIRE(game.status() == GameStatus::Playing);
}

TEST_CASE("GameState: rejected moves leave the match untouched", "[game_state]") {
    GameState game;
    game.start();

    SECTION("wrong player") {
        REQUIRE(game.placePiece(PlayerColor::Orange, 0, CellList{{9, 9}}) == MoveResult::NotYourTurn);
    }

    SECTION("unknown piece id") {
        REQUIRE(game.placePiece(PlayerColor::Blue, 21, CellList{{4, 4}}) == MoveResult::UnknownPiece);
        REQUIRE(game.placePiece(PlayerColor::Blue, -1, CellList{{4, 4}}) == MoveResult::UnknownPiece);
    }

    SECTION("cell count differs from the piece size") {
        REQUIRE(game.placePiece(PlayerColor::Blue, 1, CellList{{4, 4}}) == MoveResult::WrongCellCount);
    }

    SECTION("placement breaks the rules") {
        REQUIRE(game.placePiece(PlayerColor::Blue, 0, CellList{{0, 0}}) == MoveResult::InvalidPlacement);
        REQUIRE(game.placePiece(PlayerColor::Blue, 1, CellList{{4, 13}, {4, 14}}) == MoveResult::InvalidPlacement);
    }

    REQUIRE(game.currentTurn() == PlayerColor::Blue);
    REQUIRE(game.remainingPieces(PlayerColor::Blue).size() == 21);
    REQUIRE(game.board() == Board{});
}

TEST_CASE("GameState: a piece can be played once", "[game_state]") {
    GameState game;
    game.start();

    REQUIRE(game.placePiece(PlayerColor::Blue, 0, CellList{{4, 4}}) == MoveResult::Accepted);
    REQUIRE(game.placePiece(PlayerColor::Orange, 0, CellList{{9, 9}}) == MoveResult::Accepted);
    REQUIRE(game.placePiece(PlayerColor::Blue, 0, CellList{{5, 5}}) == MoveResult::PieceNotAvailable);

    REQUIRE(game.placePiece(PlayerColor::Blue, 1, CellList{{5, 5}, {5, 6}}) == MoveResult::Accepted);
    REQUIRE(game.currentTurn() == PlayerColor::Orange);
}

TEST_CASE("GameState: passing is refused while a move exists", "[game_state][pass]") {
    GameState game;
    game.start();

    REQUIRE(game.canMove(PlayerColor::Blue));
    REQUIRE(game.passTurn(PlayerColor::Blue) == MoveResult::ValidMovesAvailable);
    REQUIRE(game.passTurn(PlayerColor::Orange) == MoveResult::NotYourTurn);
    REQUIRE(game.currentTurn() == PlayerColor::Blue);
    REQUIRE_FALSE(game.lastPassedBy().has_value());
}

TEST_CASE("GameState: configurable first player", "[game_state][config]") {
    MatchConfig config;
    config.firstPlayer = PlayerColor::Orange;

    GameState game{config};
    game.start();

    REQUIRE(game.currentTurn() == PlayerColor::Orange);
    REQUIRE(game.placePiece(PlayerColor::Blue, 0, CellList{{4, 4}}) == MoveResult::NotYourTurn);
    REQUIRE(game.placePiece(PlayerColor::Orange, 20,
                            CellList{{8, 9}, {9, 8}, {9, 9}, {9, 10}, {10, 9}}) == MoveResult::Accepted);
    REQUIRE(game.currentTurn() == PlayerColor::Blue);
    REQUIRE(game.score(PlayerColor::Orange) == 84);
}

TEST_CASE("GameState: reset returns to a waiting match", "[game_state]") {
    MatchConfig config;
    config.firstPlayer = PlayerColor::Orange;
    GameState game{config};
    game.start();
    REQUIRE(game.placePiece(PlayerColor::Orange, 0, CellList{{9, 9}}) == MoveResult::Accepted);

    game.reset();

    REQUIRE(game.status() == GameStatus::Waiting);
    REQUIRE(game.currentTurn() == PlayerColor::Orange);
    REQUIRE(game.board() == Board{});
    REQUIRE(game.remainingPieces(PlayerColor::Orange).size() == 21);
    REQUIRE(game.config().firstPlayer == PlayerColor::Orange);
}

TEST_CASE("GameState: start only leaves the waiting state", "[game_state]") {
    GameState game;
    game.start();
    REQUIRE(game.placePiece(PlayerColor::Blue, 0, CellList{{4, 4}}) == MoveResult::Accepted);

    game.start();
    REQUIRE(game.currentTurn() == PlayerColor::Orange);
    REQUIRE(game.board().cell(4, 4) == CellOwner::Blue);
}

TEST_CASE("GameState: result messages", "[game_state]") {
    REQUIRE(std::string{toString(MoveResult::InvalidPlacement)} ==
            "Invalid move, try another orientation or anchor");
    REQUIRE(std::string{toString(MoveResult::ValidMovesAvailable)} == "You have valid moves available");
    REQUIRE(std::string{toString(GameStatus::Finished)} == "Finished");
}
