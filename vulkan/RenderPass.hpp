#pragma once

#include "vulkan.hpp"

// Command recording scope for one render pass on the current frame target.
// The pass ends when the object is destroyed.
class RenderPass {
public:
    virtual ~RenderPass() = default;

    virtual void bindPipeline(const Pipeline& pipeline) = 0;
    virtual void bindDescriptorSet(const Pipeline& pipeline, uint32_t set, VkDescriptorSet descriptorSet) = 0;
    virtual void pushConstants(const Pipeline& pipeline, VkShaderStageFlags stages, uint32_t size, const void* data) = 0;
    virtual void bindVertexBuffer(uint32_t binding, const Buffer& buffer) = 0;
    virtual void bindIndexBuffer(const Buffer& buffer, VkIndexType indexType) = 0;
    virtual void drawIndexed(uint32_t indexCount, uint32_t instanceCount) = 0;

    // raw command buffer, for recorders that bypass the abstraction (ImGui)
    virtual VkCommandBuffer getCommandBuffer() const = 0;
};
