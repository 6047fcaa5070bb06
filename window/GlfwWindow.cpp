#include "GlfwWindow.hpp"
#include <stdexcept>
#include <iostream>

GlfwWindow::GlfwWindow(const std::string& title, uint32_t width, uint32_t height) {
    if (!glfwInit()) {
        throw std::runtime_error("failed to initialize GLFW!");
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
    // shown by the frame loop once the first frame can be drawn
    glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);
    window = glfwCreateWindow(static_cast<int>(width), static_cast<int>(height), title.c_str(), nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        throw std::runtime_error("failed to create window!");
    }
    windowedWidth = static_cast<int>(width);
    windowedHeight = static_cast<int>(height);
}

GlfwWindow::~GlfwWindow() {
    if (window) {
        glfwDestroyWindow(window);
        window = nullptr;
    }
    glfwTerminate();
}

void GlfwWindow::show() {
    glfwShowWindow(window);
}

WindowExtent GlfwWindow::getFramebufferSize() const {
    int width = 0, height = 0;
    glfwGetFramebufferSize(window, &width, &height);
    return WindowExtent { static_cast<uint32_t>(width), static_cast<uint32_t>(height) };
}

WindowExtent GlfwWindow::getWindowSize() const {
    // report the windowed size while fullscreen so it survives a restart
    if (isFullscreen()) {
        return WindowExtent { static_cast<uint32_t>(windowedWidth), static_cast<uint32_t>(windowedHeight) };
    }
    int width = 0, height = 0;
    glfwGetWindowSize(window, &width, &height);
    return WindowExtent { static_cast<uint32_t>(width), static_cast<uint32_t>(height) };
}

void GlfwWindow::requestSize(uint32_t width, uint32_t height) {
    if (isFullscreen()) {
        windowedWidth = static_cast<int>(width);
        windowedHeight = static_cast<int>(height);
        return;
    }
    glfwSetWindowSize(window, static_cast<int>(width), static_cast<int>(height));
}

bool GlfwWindow::isFullscreen() const {
    return glfwGetWindowMonitor(window) != nullptr;
}

GLFWmonitor* GlfwWindow::findMonitor(const std::optional<std::string>& name) {
    if (name && !name->empty()) {
        int count = 0;
        GLFWmonitor** monitors = glfwGetMonitors(&count);
        for (int i = 0; i < count; ++i) {
            const char* monitorName = glfwGetMonitorName(monitors[i]);
            if (monitorName && *name == monitorName) {
                return monitors[i];
            }
        }
        std::cerr << "[GlfwWindow] monitor '" << *name << "' not found, using primary" << std::endl;
    }
    return glfwGetPrimaryMonitor();
}

void GlfwWindow::setFullscreen(bool fullscreen, const std::optional<std::string>& monitorName) {
    if (fullscreen == isFullscreen()) return;

    if (fullscreen) {
        glfwGetWindowPos(window, &windowedPosX, &windowedPosY);
        glfwGetWindowSize(window, &windowedWidth, &windowedHeight);

        GLFWmonitor* monitor = findMonitor(monitorName);
        if (!monitor) return;
        const GLFWvidmode* mode = glfwGetVideoMode(monitor);
        if (!mode) return;

        glfwSetWindowMonitor(window, monitor, 0, 0, mode->width, mode->height, mode->refreshRate);
        return;
    }

    glfwSetWindowMonitor(window, nullptr, windowedPosX, windowedPosY, windowedWidth, windowedHeight, 0);
}

std::optional<std::string> GlfwWindow::getMonitorName() const {
    GLFWmonitor* monitor = glfwGetWindowMonitor(window);
    if (!monitor) return std::nullopt;
    const char* name = glfwGetMonitorName(monitor);
    if (!name) return std::nullopt;
    return std::string(name);
}

void GlfwWindow::setCursorVisible(bool visible) {
    if (visible) {
        glfwSetInputMode(window, GLFW_CURSOR, GLFW_CURSOR_NORMAL);
        if (glfwRawMouseMotionSupported()) {
            glfwSetInputMode(window, GLFW_RAW_MOUSE_MOTION, GLFW_FALSE);
        }
        return;
    }
    glfwSetInputMode(window, GLFW_CURSOR, GLFW_CURSOR_DISABLED);
    if (glfwRawMouseMotionSupported()) {
        glfwSetInputMode(window, GLFW_RAW_MOUSE_MOTION, GLFW_TRUE);
    }
}

void GlfwWindow::requestClose() {
    glfwSetWindowShouldClose(window, GLFW_TRUE);
}

bool GlfwWindow::shouldClose() const {
    return glfwWindowShouldClose(window);
}

void GlfwWindow::pollEvents() {
    glfwPollEvents();
}

void GlfwWindow::waitEvents() {
    glfwWaitEvents();
}

double GlfwWindow::getTime() const {
    return glfwGetTime();
}
