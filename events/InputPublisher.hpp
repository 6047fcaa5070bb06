#pragma once

#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>
#include <tsl/robin_map.h>
#include "InputAction.hpp"

class EventManager;

// Translates GLFW callbacks into events on the EventManager. Keys go through
// a binding table; repeats are dropped so every ActionEvent is a real edge.
// Install before ImGui so its backend chains onto these callbacks.
class InputPublisher {
public:
    InputPublisher(GLFWwindow* window, EventManager* eventManager);
    ~InputPublisher();

    InputPublisher(const InputPublisher&) = delete;
    InputPublisher& operator=(const InputPublisher&) = delete;

    void bind(int key, InputAction action);
    void unbind(int key);
    const tsl::robin_map<int, InputAction>& getBindings() const { return bindings; }

private:
    static void keyCallback(GLFWwindow* window, int key, int scancode, int action, int mods);
    static void mouseButtonCallback(GLFWwindow* window, int button, int action, int mods);
    static void cursorPosCallback(GLFWwindow* window, double x, double y);
    static void framebufferSizeCallback(GLFWwindow* window, int width, int height);
    static void closeCallback(GLFWwindow* window);

    static InputPublisher* from(GLFWwindow* window);

    GLFWwindow* window;
    EventManager* eventManager;
    tsl::robin_map<int, InputAction> bindings;

    bool hasCursor = false;
    double lastX = 0.0;
    double lastY = 0.0;
};
