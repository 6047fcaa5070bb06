#pragma once

#include "GraphicsContext.hpp"
#include "../math/Camera.hpp"

// Owns the descriptor set layout every technique uses for the camera uniform.
class CameraBinder {
public:
    explicit CameraBinder(GraphicsContext& context);
    ~CameraBinder();

    CameraBinder(const CameraBinder&) = delete;
    CameraBinder& operator=(const CameraBinder&) = delete;

    VkDescriptorSetLayout getLayout() const { return layout; }

private:
    GraphicsContext& context;
    VkDescriptorSetLayout layout = VK_NULL_HANDLE;
};

// Uniform buffer mirroring the camera's view-projection. Must be updated once
// per frame before any draw that references it.
class CameraBinding {
public:
    CameraBinding(GraphicsContext& context, const CameraBinder& binder);
    ~CameraBinding();

    CameraBinding(const CameraBinding&) = delete;
    CameraBinding& operator=(const CameraBinding&) = delete;

    void update(const Camera& camera);

    VkDescriptorSet getDescriptorSet() const { return descriptorSet; }
    const Buffer& getBuffer() const { return uniform; }

private:
    GraphicsContext& context;
    Buffer uniform;
    VkDescriptorSet descriptorSet = VK_NULL_HANDLE;
};
