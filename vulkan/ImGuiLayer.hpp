#pragma once

#include "VulkanContext.hpp"
#include "RenderPass.hpp"

// Dear ImGui on top of the context's render pass. Construct after the
// InputPublisher so the GLFW backend chains its callbacks onto ours.
class ImGuiLayer {
public:
    ImGuiLayer(VulkanContext& context, GLFWwindow* window);
    ~ImGuiLayer();

    ImGuiLayer(const ImGuiLayer&) = delete;
    ImGuiLayer& operator=(const ImGuiLayer&) = delete;

    void newFrame();
    // Finishes the frame and records its draw data into the open pass
    void render(RenderPass& pass);

    bool wantsMouse() const;

private:
    VkDevice device;
    VkDescriptorPool descriptorPool = VK_NULL_HANDLE;
    bool frameOpen = false;
};
