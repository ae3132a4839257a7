#pragma once

#include "core/GameState.hpp"
#include "core/MoveGenerator.hpp"
#include "core/OrientationNavigator.hpp"
#include "controller/InputAction.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace blokus::controller {

// Placing interaction for the player whose turn it is: select a piece,
// preview it on the board, rotate/flip/cycle the preview, then confirm.
class GameController {
public:
    /// Controller does not own the GameState; caller keeps it alive.
    explicit GameController(blokus::core::GameState& game);

    /// Enter the placing state. Fails if the piece is not in the current
    /// player's hand or the match is not running.
    bool selectPiece(int pieceId);

    /// Use (row, col) as anchor for the selected piece, keeping the current
    /// orientation when it fits there. Returns false if nothing fits.
    bool clickBoard(int row, int col);

    /// Snap the preview to the valid anchor nearest to a cursor position.
    bool snapToCursor(double row, double col);

    /// Jump to one entry of allValidPlacements().
    bool setPlacementByIndex(std::size_t index);

    void handleAction(InputAction action);

    /// Drop selection and preview.
    void clearSelection();

    std::optional<int> selectedPiece() const noexcept { return selectedPiece_; }
    int orientationIndex() const noexcept { return orientation_; }
    const std::optional<blokus::core::Placement>& preview() const noexcept { return preview_; }
    std::size_t placementIndex() const noexcept { return placementIndex_; }
    blokus::core::MoveResult lastResult() const noexcept { return lastResult_; }

    /// Anchors worth highlighting: all corner anchors of the current player,
    /// narrowed to those usable by the selected piece.
    std::vector<blokus::core::Cell> highlightedAnchors() const;

    /// Distinct placements of the selected piece (empty without selection).
    std::vector<blokus::core::Placement> allValidPlacements() const;

    /// True when the current player has no legal move and must pass.
    bool mustPass() const;

private:
    blokus::core::GameState& game_;
    std::optional<int> selectedPiece_;
    int orientation_{0};
    std::optional<blokus::core::Placement> preview_;
    std::size_t placementIndex_{0};
    blokus::core::PlayerColor selectionTurn_{blokus::core::PlayerColor::Blue};
    blokus::core::MoveResult lastResult_{blokus::core::MoveResult::Accepted};

    bool isPlacing() const;
    void rotate(blokus::core::RotationDirection direction);
    void flip();
    void cyclePlacement(int delta);
    void confirm();
    void pass();
    void syncPlacementIndex();
};

} // namespace blokus::controller
