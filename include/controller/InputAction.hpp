#pragma once

namespace blokus::controller {

// Discrete player input actions while placing a piece.
// These are UI- and platform-agnostic: keyboard, touch, network, etc.
enum class InputAction {
    RotateCW,
    RotateCCW,
    Flip,
    NextPlacement,
    PreviousPlacement,
    ClearPreview,
    Confirm,
    Pass
};

} // namespace blokus::controller
