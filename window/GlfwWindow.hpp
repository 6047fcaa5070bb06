#pragma once

#include "AppWindow.hpp"
#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>

class GlfwWindow : public AppWindow {
public:
    GlfwWindow(const std::string& title, uint32_t width, uint32_t height);
    ~GlfwWindow() override;

    GlfwWindow(const GlfwWindow&) = delete;
    GlfwWindow& operator=(const GlfwWindow&) = delete;

    void show() override;
    WindowExtent getFramebufferSize() const override;
    WindowExtent getWindowSize() const override;
    void requestSize(uint32_t width, uint32_t height) override;

    bool isFullscreen() const override;
    void setFullscreen(bool fullscreen, const std::optional<std::string>& monitor = std::nullopt) override;
    std::optional<std::string> getMonitorName() const override;

    void setCursorVisible(bool visible) override;

    void requestClose() override;
    bool shouldClose() const override;
    void pollEvents() override;
    void waitEvents() override;
    double getTime() const override;

    GLFWwindow* getHandle() const { return window; }

private:
    static GLFWmonitor* findMonitor(const std::optional<std::string>& name);

    GLFWwindow* window = nullptr;

    // windowed rect restored when leaving fullscreen
    int windowedPosX = 0;
    int windowedPosY = 0;
    int windowedWidth = 0;
    int windowedHeight = 0;
};
