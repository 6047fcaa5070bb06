#pragma once

#include "Event.hpp"
#include "InputAction.hpp"
#include <string>

// Key bound to an action went down (pressed = true) or up
class ActionEvent : public Event {
public:
    ActionEvent(InputAction action, bool pressed) : action(action), pressed(pressed) {}
    std::string name() const override { return "ActionEvent"; }

    InputAction action;
    bool pressed;
};

// button uses the GLFW_MOUSE_BUTTON_* numbering
class MouseButtonEvent : public Event {
public:
    MouseButtonEvent(int button, bool pressed) : button(button), pressed(pressed) {}
    std::string name() const override { return "MouseButtonEvent"; }

    static constexpr int LEFT = 0; // GLFW_MOUSE_BUTTON_LEFT

    int button;
    bool pressed;
};

// Pointer movement since the previous motion event, in screen units
class PointerMotionEvent : public Event {
public:
    PointerMotionEvent(double dx, double dy) : dx(dx), dy(dy) {}
    std::string name() const override { return "PointerMotionEvent"; }

    double dx;
    double dy;
};
