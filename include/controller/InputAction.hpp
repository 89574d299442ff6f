#pragma once

namespace blockfall::controller {

// Discrete player input actions.
// These are UI- and platform-agnostic: keyboard, gamepad, touch, etc.
enum class InputAction {
    MoveLeft,
    MoveRight,
    SoftDrop,
    Rotate
};

} // namespace blockfall::controller
