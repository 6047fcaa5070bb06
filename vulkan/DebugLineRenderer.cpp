#include "DebugLineRenderer.hpp"
#include <cstddef>

DebugLineRenderer::DebugBatch::DebugBatch(DebugLineRenderer& renderer)
    : vertices(renderer.vertexBuffer.beginBatch()),
      indices(renderer.indexBuffer.beginBatch()),
      nextIndex(static_cast<uint32_t>(renderer.vertexBuffer.size())) {}

void DebugLineRenderer::DebugBatch::pushVertex(const glm::vec3& position, const glm::vec3& color) {
    vertices.push(DebugVertex { position, color });
    indices.push(nextIndex++);
}

void DebugLineRenderer::DebugBatch::pushLine(const glm::vec3& from, const glm::vec3& to, const glm::vec3& color) {
    pushVertex(from, color);
    pushVertex(to, color);
}

void DebugLineRenderer::DebugBatch::close() {
    vertices.close();
    indices.close();
}

DebugLineRenderer::DebugLineRenderer(GraphicsContext& context_, VkFormat colorFormat, VkFormat depthFormat,
                                     VkDescriptorSetLayout cameraLayout)
    : context(context_),
      vertexBuffer(context_, INITIAL_CAPACITY, VK_BUFFER_USAGE_VERTEX_BUFFER_BIT),
      indexBuffer(context_, INITIAL_CAPACITY, VK_BUFFER_USAGE_INDEX_BUFFER_BIT) {
    VkShaderModule vertModule = context.createShaderModule("shaders/debug_line.vert.spv");
    VkShaderModule fragModule = context.createShaderModule("shaders/debug_line.frag.spv");

    PipelineConfig config;
    config.addStage(vertModule, VK_SHADER_STAGE_VERTEX_BIT);
    config.addStage(fragModule, VK_SHADER_STAGE_FRAGMENT_BIT);
    config.bindings = {
        VkVertexInputBindingDescription { 0, sizeof(DebugVertex), VK_VERTEX_INPUT_RATE_VERTEX }
    };
    config.attributes = {
        VkVertexInputAttributeDescription { 0, 0, VK_FORMAT_R32G32B32_SFLOAT, offsetof(DebugVertex, position) },
        VkVertexInputAttributeDescription { 1, 0, VK_FORMAT_R32G32B32_SFLOAT, offsetof(DebugVertex, color) }
    };
    config.setLayouts = { cameraLayout };
    config.colorFormat = colorFormat;
    config.depthFormat = depthFormat;
    config.topology = VK_PRIMITIVE_TOPOLOGY_LINE_LIST;
    config.cullMode = VK_CULL_MODE_NONE;
    // overlay: drawn on top, the depth attachment is neither read nor written
    config.depthTest = false;
    config.depthWrite = false;

    pipeline = context.createGraphicsPipeline(config);

    context.destroyShaderModule(vertModule);
    context.destroyShaderModule(fragModule);
}

DebugLineRenderer::~DebugLineRenderer() {
    context.destroyPipeline(pipeline);
}

DebugLineRenderer::DebugBatch DebugLineRenderer::beginBatch() {
    return DebugBatch(*this);
}

void DebugLineRenderer::clear() {
    vertexBuffer.clear();
    indexBuffer.clear();
}

void DebugLineRenderer::draw(RenderPass& pass, const CameraBinding& camera) const {
    if (indexBuffer.empty()) return;

    pass.bindPipeline(pipeline);
    pass.bindDescriptorSet(pipeline, 0, camera.getDescriptorSet());
    pass.bindVertexBuffer(0, vertexBuffer.getBuffer());
    pass.bindIndexBuffer(indexBuffer.getBuffer(), VK_INDEX_TYPE_UINT32);
    pass.drawIndexed(static_cast<uint32_t>(indexBuffer.size()), 1);
}
