#include "InputPublisher.hpp"
#include "EventManager.hpp"
#include "InputEvents.hpp"
#include "WindowEvents.hpp"
#include <stdexcept>

InputPublisher::InputPublisher(GLFWwindow* window_, EventManager* eventManager_)
    : window(window_), eventManager(eventManager_) {
    if (!window || !eventManager) {
        throw std::runtime_error("failed to create input publisher: missing window or event manager!");
    }

    bind(GLFW_KEY_W, InputAction::MoveForward);
    bind(GLFW_KEY_S, InputAction::MoveBackward);
    bind(GLFW_KEY_D, InputAction::MoveRight);
    bind(GLFW_KEY_A, InputAction::MoveLeft);
    bind(GLFW_KEY_SPACE, InputAction::MoveUp);
    bind(GLFW_KEY_LEFT_SHIFT, InputAction::MoveDown);
    bind(GLFW_KEY_F11, InputAction::ToggleFullscreen);
    bind(GLFW_KEY_ESCAPE, InputAction::Quit);
    bind(GLFW_KEY_F3, InputAction::ToggleDebugOverlay);

    glfwSetWindowUserPointer(window, this);
    glfwSetKeyCallback(window, keyCallback);
    glfwSetMouseButtonCallback(window, mouseButtonCallback);
    glfwSetCursorPosCallback(window, cursorPosCallback);
    glfwSetFramebufferSizeCallback(window, framebufferSizeCallback);
    glfwSetWindowCloseCallback(window, closeCallback);
}

InputPublisher::~InputPublisher() {
    glfwSetKeyCallback(window, nullptr);
    glfwSetMouseButtonCallback(window, nullptr);
    glfwSetCursorPosCallback(window, nullptr);
    glfwSetFramebufferSizeCallback(window, nullptr);
    glfwSetWindowCloseCallback(window, nullptr);
    glfwSetWindowUserPointer(window, nullptr);
}

void InputPublisher::bind(int key, InputAction action) {
    bindings[key] = action;
}

void InputPublisher::unbind(int key) {
    bindings.erase(key);
}

InputPublisher* InputPublisher::from(GLFWwindow* window) {
    return static_cast<InputPublisher*>(glfwGetWindowUserPointer(window));
}

void InputPublisher::keyCallback(GLFWwindow* window, int key, int, int action, int) {
    InputPublisher* self = from(window);
    if (!self || action == GLFW_REPEAT) return;
    auto it = self->bindings.find(key);
    if (it == self->bindings.end()) return;
    self->eventManager->publish(make_event<ActionEvent>(it->second, action == GLFW_PRESS));
}

void InputPublisher::mouseButtonCallback(GLFWwindow* window, int button, int action, int) {
    InputPublisher* self = from(window);
    if (!self) return;
    self->eventManager->publish(make_event<MouseButtonEvent>(button, action == GLFW_PRESS));
}

void InputPublisher::cursorPosCallback(GLFWwindow* window, double x, double y) {
    InputPublisher* self = from(window);
    if (!self) return;
    // the first sample only establishes the reference point
    if (!self->hasCursor) {
        self->hasCursor = true;
        self->lastX = x;
        self->lastY = y;
        return;
    }
    double dx = x - self->lastX;
    double dy = y - self->lastY;
    self->lastX = x;
    self->lastY = y;
    if (dx != 0.0 || dy != 0.0) {
        self->eventManager->publish(make_event<PointerMotionEvent>(dx, dy));
    }
}

void InputPublisher::framebufferSizeCallback(GLFWwindow* window, int width, int height) {
    InputPublisher* self = from(window);
    if (!self) return;
    self->eventManager->publish(make_event<WindowResizeEvent>(
        static_cast<uint32_t>(width > 0 ? width : 0), static_cast<uint32_t>(height > 0 ? height : 0)));
}

void InputPublisher::closeCallback(GLFWwindow* window) {
    InputPublisher* self = from(window);
    if (!self) return;
    // the Game decides whether to stop; keep the window open until it does
    glfwSetWindowShouldClose(window, GLFW_FALSE);
    self->eventManager->publish(make_event<CloseWindowEvent>());
}
