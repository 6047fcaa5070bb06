#pragma once

#include "vulkan.hpp"
#include "PipelineConfig.hpp"
#include "RenderPass.hpp"
#include <glm/glm.hpp>
#include <memory>
#include <string>

// Owner of the device, the submission queue and the presentable surface.
// Everything above the context talks to the GPU through this interface.
class GraphicsContext {
public:
    virtual ~GraphicsContext() = default;

    // Surface and frame lifecycle
    virtual void configureSurface(uint32_t width, uint32_t height) = 0;
    virtual VkExtent2D getSurfaceExtent() const = 0;
    virtual VkFormat getSurfaceFormat() const = 0;
    virtual VkFormat getDepthFormat() const = 0;

    // Hands out the next presentable image. Only one frame target may be live.
    virtual SurfaceStatus acquireFrame(FrameTarget& target) = 0;
    virtual std::unique_ptr<RenderPass> beginRenderPass(FrameTarget& target, const DepthTarget& depth,
                                                        const glm::vec4& clearColor, float clearDepth) = 0;
    virtual void submit(FrameTarget& target) = 0;
    virtual SurfaceStatus present(FrameTarget& target) = 0;

    virtual DepthTarget createDepthTarget(uint32_t width, uint32_t height) = 0;
    virtual void destroyDepthTarget(DepthTarget& target) = 0;

    // Buffers. createBuffer returns host-visible memory that writeBuffer can update in place.
    virtual Buffer createBuffer(VkDeviceSize size, VkBufferUsageFlags usage) = 0;
    virtual Buffer createDeviceLocalBuffer(const void* data, VkDeviceSize size, VkBufferUsageFlags usage) = 0;
    virtual void writeBuffer(Buffer& buffer, VkDeviceSize offset, const void* data, VkDeviceSize size) = 0;
    virtual void destroyBuffer(Buffer& buffer) = 0;

    // Pipelines
    virtual VkShaderModule createShaderModule(const std::string& spirvPath) = 0;
    virtual void destroyShaderModule(VkShaderModule module) = 0;
    virtual Pipeline createGraphicsPipeline(const PipelineConfig& config) = 0;
    virtual void destroyPipeline(Pipeline& pipeline) = 0;

    // Uniform descriptor sets (binding 0 = uniform buffer)
    virtual VkDescriptorSetLayout createUniformSetLayout(VkShaderStageFlags stages) = 0;
    virtual void destroySetLayout(VkDescriptorSetLayout layout) = 0;
    virtual VkDescriptorSet createUniformDescriptorSet(VkDescriptorSetLayout layout, const Buffer& uniform) = 0;
    virtual void freeDescriptorSet(VkDescriptorSet descriptorSet) = 0;

    virtual void waitIdle() = 0;
};
