#pragma once

#include <cstdint>
#include <optional>
#include <string>

struct WindowExtent {
    uint32_t width = 0;
    uint32_t height = 0;
};

// Presentation window as seen by the Game. Sizes are in pixels; the
// framebuffer size is what the surface has to match.
class AppWindow {
public:
    virtual ~AppWindow() = default;

    virtual void show() = 0;
    virtual WindowExtent getFramebufferSize() const = 0;
    virtual WindowExtent getWindowSize() const = 0;
    virtual void requestSize(uint32_t width, uint32_t height) = 0;

    virtual bool isFullscreen() const = 0;
    // Borderless fullscreen on the named monitor, or the primary one when
    // the name is empty or not connected. Leaving restores the windowed rect.
    virtual void setFullscreen(bool fullscreen, const std::optional<std::string>& monitor = std::nullopt) = 0;
    virtual std::optional<std::string> getMonitorName() const = 0;

    virtual void setCursorVisible(bool visible) = 0;

    virtual void requestClose() = 0;
    virtual bool shouldClose() const = 0;
    virtual void pollEvents() = 0;
    virtual void waitEvents() = 0;

    // monotonic, seconds
    virtual double getTime() const = 0;
};
