#pragma once

#include "RenderPass.hpp"

// vkCmdBeginRenderPass has already been recorded when this is created;
// vkCmdEndRenderPass is recorded by the destructor.
class VulkanRenderPass : public RenderPass {
public:
    explicit VulkanRenderPass(VkCommandBuffer commandBuffer);
    ~VulkanRenderPass() override;

    VulkanRenderPass(const VulkanRenderPass&) = delete;
    VulkanRenderPass& operator=(const VulkanRenderPass&) = delete;

    void bindPipeline(const Pipeline& pipeline) override;
    void bindDescriptorSet(const Pipeline& pipeline, uint32_t set, VkDescriptorSet descriptorSet) override;
    void pushConstants(const Pipeline& pipeline, VkShaderStageFlags stages, uint32_t size, const void* data) override;
    void bindVertexBuffer(uint32_t binding, const Buffer& buffer) override;
    void bindIndexBuffer(const Buffer& buffer, VkIndexType indexType) override;
    void drawIndexed(uint32_t indexCount, uint32_t instanceCount) override;

    VkCommandBuffer getCommandBuffer() const override { return commandBuffer; }

private:
    VkCommandBuffer commandBuffer;
};
