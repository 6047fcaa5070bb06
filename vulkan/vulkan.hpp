#pragma once

#include <vulkan/vulkan.h>
#include <cstdint>
#include <optional>

// Small helper types shared by the context, the techniques and the tests
struct Buffer {
    VkBuffer buffer = VK_NULL_HANDLE;
    VkDeviceMemory memory = VK_NULL_HANDLE;
    VkDeviceSize size = 0;
};

// Depth attachment sized to match the surface
struct DepthTarget {
    VkImage image = VK_NULL_HANDLE;
    VkDeviceMemory memory = VK_NULL_HANDLE;
    VkImageView view = VK_NULL_HANDLE;
    VkFormat format = VK_FORMAT_D32_SFLOAT;
    uint32_t width = 0;
    uint32_t height = 0;
};

// Presentable image handed out for the duration of one frame
struct FrameTarget {
    uint32_t imageIndex = 0;
    VkImageView view = VK_NULL_HANDLE;
    VkCommandBuffer commandBuffer = VK_NULL_HANDLE;
    bool live = false;
};

// Outcome of acquire/present. Outdated and Lost are recoverable by
// reconfiguring the surface; Fatal ends the frame loop.
enum class SurfaceStatus {
    Ok,
    Outdated,
    Lost,
    Fatal
};

struct Pipeline {
    VkPipeline pipeline = VK_NULL_HANDLE;
    VkPipelineLayout layout = VK_NULL_HANDLE;
};

// Queue family indices helper
struct QueueFamilyIndices {
    std::optional<uint32_t> graphicsFamily;
    std::optional<uint32_t> presentFamily;
    bool isComplete() const {
        return graphicsFamily.has_value() && presentFamily.has_value();
    }
};

inline const char* toString(SurfaceStatus status) {
    switch (status) {
        case SurfaceStatus::Ok: return "ok";
        case SurfaceStatus::Outdated: return "outdated";
        case SurfaceStatus::Lost: return "lost";
        case SurfaceStatus::Fatal: return "fatal";
    }
    return "unknown";
}
