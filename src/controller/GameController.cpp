#include "controller/GameController.hpp"
#include "core/Geometry.hpp"
#include "core/Piece.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace blokus::controller {

using core::GameStatus;
using core::MoveResult;
using core::Placement;
using core::RotationDirection;

GameController::GameController(core::GameState& game)
    : game_{game}
{
}

bool GameController::isPlacing() const {
    // Selection only lives for the turn it was made in
    return selectedPiece_.has_value()
        && game_.status() == GameStatus::Playing
        && game_.currentTurn() == selectionTurn_
        && game_.hasPiece(selectionTurn_, *selectedPiece_);
}

bool GameController::selectPiece(int pieceId) {
    if (game_.status() != GameStatus::Playing) return false;
    if (!game_.hasPiece(game_.currentTurn(), pieceId)) return false;

    selectedPiece_ = pieceId;
    selectionTurn_ = game_.currentTurn();
    orientation_ = 0;
    preview_.reset();
    placementIndex_ = 0;
    return true;
}

void GameController::clearSelection() {
    selectedPiece_.reset();
    orientation_ = 0;
    preview_.reset();
    placementIndex_ = 0;
}

bool GameController::clickBoard(int row, int col) {
    if (!isPlacing()) {
        clearSelection();
        return false;
    }

    const auto placements = core::findValidPlacementsAtAnchor(
        game_.board(), *selectedPiece_, row, col, game_.currentTurn());
    if (placements.empty()) return false;

    auto match = std::find_if(placements.begin(), placements.end(), [&](const Placement& p) {
        return p.orientationIndex == orientation_;
    });
    const Placement& chosen = match != placements.end() ? *match : placements.front();

    orientation_ = chosen.orientationIndex;
    preview_ = chosen;
    syncPlacementIndex();
    return true;
}

bool GameController::snapToCursor(double row, double col) {
    if (!isPlacing()) {
        clearSelection();
        return false;
    }

    const auto& board = game_.board();
    const auto player = game_.currentTurn();

    const auto anchors = core::validAnchorsForPiece(board, *selectedPiece_, player);
    const auto anchor = core::findNearestValidAnchor(static_cast<int>(std::floor(row + 0.5)),
                                                     static_cast<int>(std::floor(col + 0.5)),
                                                     anchors);
    if (!anchor) return false;

    const auto placements = core::findValidPlacementsAtAnchor(
        board, *selectedPiece_, anchor->row, anchor->col, player);
    auto best = core::findBestPlacementForCursor(row, col, placements, orientation_);
    if (!best) return false;

    orientation_ = best->orientationIndex;
    preview_ = std::move(best);
    syncPlacementIndex();
    return true;
}

bool GameController::setPlacementByIndex(std::size_t index) {
    if (!isPlacing()) return false;

    const auto placements = allValidPlacements();
    if (index >= placements.size()) return false;

    orientation_ = placements[index].orientationIndex;
    preview_ = placements[index];
    placementIndex_ = index;
    return true;
}

void GameController::handleAction(InputAction action) {
    if (action == InputAction::Pass) {
        pass();
        return;
    }

    if (!isPlacing()) {
        clearSelection();
        if (action == InputAction::Confirm) {
            lastResult_ = MoveResult::InvalidPlacement;
        }
        return;
    }

    switch (action) {
    case InputAction::RotateCW:
        rotate(RotationDirection::Clockwise);
        break;
    case InputAction::RotateCCW:
        rotate(RotationDirection::CounterClockwise);
        break;
    case InputAction::Flip:
        flip();
        break;
    case InputAction::NextPlacement:
        cyclePlacement(1);
        break;
    case InputAction::PreviousPlacement:
        cyclePlacement(-1);
        break;
    case InputAction::ClearPreview:
        // First press drops the preview, second drops the selection
        if (preview_) {
            preview_.reset();
        } else {
            clearSelection();
        }
        break;
    case InputAction::Confirm:
        confirm();
        break;
    case InputAction::Pass:
        break;
    }
}

void GameController::rotate(RotationDirection direction) {
    if (preview_) {
        auto next = core::nextValidOrientation(
            game_.board(), *selectedPiece_, preview_->cells, game_.currentTurn(), direction);
        if (next) {
            orientation_ = next->orientationIndex;
            preview_ = std::move(next);
            syncPlacementIndex();
        }
        return;
    }

    // Nothing on the board yet: just step through the orientation list
    const int count = static_cast<int>(core::orientationsOf(*selectedPiece_).size());
    const int delta = direction == RotationDirection::Clockwise ? 1 : -1;
    orientation_ = (orientation_ + delta + count) % count;
}

void GameController::flip() {
    if (!preview_) return;

    auto flipped = core::flippedOrientation(
        game_.board(), *selectedPiece_, preview_->cells, game_.currentTurn());
    if (flipped) {
        orientation_ = flipped->orientationIndex;
        preview_ = std::move(flipped);
        syncPlacementIndex();
    }
}

void GameController::cyclePlacement(int delta) {
    const auto placements = allValidPlacements();
    if (placements.empty()) return;

    const auto count = static_cast<long>(placements.size());
    long index = preview_ ? static_cast<long>(placementIndex_) + delta : (delta > 0 ? 0 : count - 1);
    index = ((index % count) + count) % count;

    const auto& chosen = placements[static_cast<std::size_t>(index)];
    orientation_ = chosen.orientationIndex;
    preview_ = chosen;
    placementIndex_ = static_cast<std::size_t>(index);
}

void GameController::confirm() {
    if (!preview_) {
        lastResult_ = MoveResult::InvalidPlacement;
        return;
    }

    lastResult_ = game_.placePiece(game_.currentTurn(), *selectedPiece_, preview_->cells);
    if (lastResult_ == MoveResult::Accepted) {
        clearSelection();
    }
}

void GameController::pass() {
    lastResult_ = game_.passTurn(game_.currentTurn());
    if (lastResult_ == MoveResult::Accepted) {
        clearSelection();
    }
}

void GameController::syncPlacementIndex() {
    if (!preview_) return;

    const auto placements = allValidPlacements();
    for (std::size_t i = 0; i < placements.size(); ++i) {
        if (core::cellsEqual(placements[i].cells, preview_->cells)) {
            placementIndex_ = i;
            return;
        }
    }
}

std::vector<core::Cell> GameController::highlightedAnchors() const {
    if (game_.status() != GameStatus::Playing) return {};

    const auto player = game_.currentTurn();
    if (isPlacing()) {
        return core::validAnchorsForPiece(game_.board(), *selectedPiece_, player);
    }
    return core::findCornerAnchors(game_.board(), player);
}

std::vector<Placement> GameController::allValidPlacements() const {
    if (!isPlacing()) return {};
    return core::allValidPlacements(game_.board(), *selectedPiece_, game_.currentTurn());
}

bool GameController::mustPass() const {
    return game_.status() == GameStatus::Playing && !game_.canMove(game_.currentTurn());
}

} // namespace blokus::controller
