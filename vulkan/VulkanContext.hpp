#pragma once

#include "GraphicsContext.hpp"
#include "FramebufferKey.hpp"
#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>
#include <tsl/robin_map.h>
#include <vector>

// Production GraphicsContext: one device, one graphics/present queue pair, a
// swapchain and a single frame in flight.
class VulkanContext : public GraphicsContext {
public:
    static constexpr VkFormat DEPTH_FORMAT = VK_FORMAT_D32_SFLOAT;

    explicit VulkanContext(GLFWwindow* window);
    ~VulkanContext() override;

    VulkanContext(const VulkanContext&) = delete;
    VulkanContext& operator=(const VulkanContext&) = delete;

    void configureSurface(uint32_t width, uint32_t height) override;
    VkExtent2D getSurfaceExtent() const override { return swapchainExtent; }
    VkFormat getSurfaceFormat() const override { return surfaceFormat.format; }
    VkFormat getDepthFormat() const override { return DEPTH_FORMAT; }

    SurfaceStatus acquireFrame(FrameTarget& target) override;
    std::unique_ptr<RenderPass> beginRenderPass(FrameTarget& target, const DepthTarget& depth,
                                                const glm::vec4& clearColor, float clearDepth) override;
    void submit(FrameTarget& target) override;
    SurfaceStatus present(FrameTarget& target) override;

    DepthTarget createDepthTarget(uint32_t width, uint32_t height) override;
    void destroyDepthTarget(DepthTarget& target) override;

    Buffer createBuffer(VkDeviceSize size, VkBufferUsageFlags usage) override;
    Buffer createDeviceLocalBuffer(const void* data, VkDeviceSize size, VkBufferUsageFlags usage) override;
    void writeBuffer(Buffer& buffer, VkDeviceSize offset, const void* data, VkDeviceSize size) override;
    void destroyBuffer(Buffer& buffer) override;

    VkShaderModule createShaderModule(const std::string& spirvPath) override;
    void destroyShaderModule(VkShaderModule module) override;
    Pipeline createGraphicsPipeline(const PipelineConfig& config) override;
    void destroyPipeline(Pipeline& pipeline) override;

    VkDescriptorSetLayout createUniformSetLayout(VkShaderStageFlags stages) override;
    void destroySetLayout(VkDescriptorSetLayout layout) override;
    VkDescriptorSet createUniformDescriptorSet(VkDescriptorSetLayout layout, const Buffer& uniform) override;
    void freeDescriptorSet(VkDescriptorSet descriptorSet) override;

    void waitIdle() override;

    // raw handles for the ImGui backend
    VkInstance getInstance() const { return instance; }
    VkPhysicalDevice getPhysicalDevice() const { return physicalDevice; }
    VkDevice getDevice() const { return device; }
    uint32_t getGraphicsFamily() const { return queueFamilies.graphicsFamily.value(); }
    VkQueue getGraphicsQueue() const { return graphicsQueue; }
    VkRenderPass getRenderPass() const { return renderPass; }
    uint32_t getImageCount() const { return static_cast<uint32_t>(swapchainImages.size()); }

private:
    void createInstance();
    bool checkValidationLayerSupport();
    void setupDebugMessenger();
    void createSurface();
    QueueFamilyIndices findQueueFamilies(VkPhysicalDevice candidate);
    void pickPhysicalDevice();
    void createLogicalDevice();
    VkSurfaceFormatKHR chooseSwapSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& availableFormats);
    VkPresentModeKHR chooseSwapPresentMode(const std::vector<VkPresentModeKHR>& availablePresentModes);
    VkExtent2D chooseSwapExtent(const VkSurfaceCapabilitiesKHR& capabilities, uint32_t width, uint32_t height);
    void createSwapchain(uint32_t width, uint32_t height);
    void cleanupSwapchain();
    void createRenderPass();
    void createCommandPool();
    void createSyncObjects();
    void createDescriptorPool(uint32_t uboCount);

    VkCommandBuffer beginSingleTimeCommands();
    void endSingleTimeCommands(VkCommandBuffer commandBuffer);
    uint32_t findMemoryType(uint32_t typeFilter, VkMemoryPropertyFlags properties);
    Buffer allocateBuffer(VkDeviceSize size, VkBufferUsageFlags usage, VkMemoryPropertyFlags properties);

    VkFramebuffer getFramebuffer(VkImageView color, VkImageView depth);
    void dropFramebuffers(VkImageView depth);
    void releaseRetiredBuffers();

    GLFWwindow* window;
    bool enableValidationLayers;

    VkInstance instance = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT debugMessenger = VK_NULL_HANDLE;
    VkSurfaceKHR surface = VK_NULL_HANDLE;
    bool surfaceLost = false;
    VkPhysicalDevice physicalDevice = VK_NULL_HANDLE;
    QueueFamilyIndices queueFamilies;
    VkDevice device = VK_NULL_HANDLE;
    VkQueue graphicsQueue = VK_NULL_HANDLE;
    VkQueue presentQueue = VK_NULL_HANDLE;

    VkSurfaceFormatKHR surfaceFormat{};
    VkSwapchainKHR swapchain = VK_NULL_HANDLE;
    std::vector<VkImage> swapchainImages;
    std::vector<VkImageView> swapchainImageViews;
    std::vector<VkSemaphore> renderFinishedSemaphores; // one per swapchain image
    VkExtent2D swapchainExtent{0, 0};

    VkRenderPass renderPass = VK_NULL_HANDLE;
    VkCommandPool commandPool = VK_NULL_HANDLE;
    VkCommandBuffer commandBuffer = VK_NULL_HANDLE;
    VkSemaphore imageAvailableSemaphore = VK_NULL_HANDLE;
    VkFence inFlightFence = VK_NULL_HANDLE;
    VkDescriptorPool descriptorPool = VK_NULL_HANDLE;

    tsl::robin_map<FramebufferKey, VkFramebuffer, FramebufferKeyHasher> framebuffers;
    std::vector<Buffer> retiredBuffers;
    bool frameLive = false;
};
