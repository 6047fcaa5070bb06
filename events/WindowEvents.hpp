#pragma once

#include "Event.hpp"
#include <cstdint>
#include <string>

// Framebuffer size changed; zero on either axis means minimized
class WindowResizeEvent : public Event {
public:
    WindowResizeEvent(uint32_t width, uint32_t height) : width(width), height(height) {}
    std::string name() const override { return "WindowResizeEvent"; }

    uint32_t width;
    uint32_t height;
};

class CloseWindowEvent : public Event {
public:
    CloseWindowEvent() = default;
    std::string name() const override { return "CloseWindowEvent"; }
};
