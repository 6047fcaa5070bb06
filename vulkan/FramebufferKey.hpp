#pragma once

#include <vulkan/vulkan.h>
#include <cstdint>
#include <functional>

// Attachment pair a cached framebuffer was created for
struct FramebufferKey {
    VkImageView color = VK_NULL_HANDLE;
    VkImageView depth = VK_NULL_HANDLE;

    bool operator==(const FramebufferKey& other) const {
        return color == other.color && depth == other.depth;
    }
};

struct FramebufferKeyHasher {
    std::size_t operator()(const FramebufferKey& key) const {
        std::size_t hash = 0;
        hash ^= std::hash<VkImageView>{}(key.color) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
        hash ^= std::hash<VkImageView>{}(key.depth) + 0x01000193 + (hash << 6) + (hash >> 2);
        return hash;
    }
};
