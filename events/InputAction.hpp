#pragma once

// Logical actions the key bindings map onto
enum class InputAction {
    MoveForward,
    MoveBackward,
    MoveRight,
    MoveLeft,
    MoveUp,
    MoveDown,
    ToggleFullscreen,
    Quit,
    ToggleDebugOverlay
};

inline const char* toString(InputAction action) {
    switch (action) {
        case InputAction::MoveForward: return "MoveForward";
        case InputAction::MoveBackward: return "MoveBackward";
        case InputAction::MoveRight: return "MoveRight";
        case InputAction::MoveLeft: return "MoveLeft";
        case InputAction::MoveUp: return "MoveUp";
        case InputAction::MoveDown: return "MoveDown";
        case InputAction::ToggleFullscreen: return "ToggleFullscreen";
        case InputAction::Quit: return "Quit";
        case InputAction::ToggleDebugOverlay: return "ToggleDebugOverlay";
    }
    return "Unknown";
}
