#include "VulkanRenderPass.hpp"

VulkanRenderPass::VulkanRenderPass(VkCommandBuffer commandBuffer_) : commandBuffer(commandBuffer_) {}

VulkanRenderPass::~VulkanRenderPass() {
    vkCmdEndRenderPass(commandBuffer);
}

void VulkanRenderPass::bindPipeline(const Pipeline& pipeline) {
    vkCmdBindPipeline(commandBuffer, VK_PIPELINE_BIND_POINT_GRAPHICS, pipeline.pipeline);
}

void VulkanRenderPass::bindDescriptorSet(const Pipeline& pipeline, uint32_t set, VkDescriptorSet descriptorSet) {
    vkCmdBindDescriptorSets(commandBuffer, VK_PIPELINE_BIND_POINT_GRAPHICS, pipeline.layout, set, 1, &descriptorSet, 0, nullptr);
}

void VulkanRenderPass::pushConstants(const Pipeline& pipeline, VkShaderStageFlags stages, uint32_t size, const void* data) {
    vkCmdPushConstants(commandBuffer, pipeline.layout, stages, 0, size, data);
}

void VulkanRenderPass::bindVertexBuffer(uint32_t binding, const Buffer& buffer) {
    VkDeviceSize offset = 0;
    vkCmdBindVertexBuffers(commandBuffer, binding, 1, &buffer.buffer, &offset);
}

void VulkanRenderPass::bindIndexBuffer(const Buffer& buffer, VkIndexType indexType) {
    vkCmdBindIndexBuffer(commandBuffer, buffer.buffer, 0, indexType);
}

void VulkanRenderPass::drawIndexed(uint32_t indexCount, uint32_t instanceCount) {
    vkCmdDrawIndexed(commandBuffer, indexCount, instanceCount, 0, 0, 0);
}
