#include "FurRenderer.hpp"
#include "../Uniforms.hpp"
#include <cstddef>
#include <cstdio>

FurRenderer::FurRenderer(GraphicsContext& context_, uint32_t layerCount_, VkFormat colorFormat, VkFormat depthFormat,
                         VkDescriptorSetLayout cameraLayout)
    : context(context_), layerCount(layerCount_) {
    VkShaderModule vertModule = context.createShaderModule("shaders/fur.vert.spv");
    VkShaderModule fragModule = context.createShaderModule("shaders/fur.frag.spv");

    PipelineConfig config;
    config.addStage(vertModule, VK_SHADER_STAGE_VERTEX_BIT);
    config.addStage(fragModule, VK_SHADER_STAGE_FRAGMENT_BIT);
    config.bindings = {
        VkVertexInputBindingDescription { 0, sizeof(Vertex), VK_VERTEX_INPUT_RATE_VERTEX },
        VkVertexInputBindingDescription { 1, sizeof(MorphVertex), VK_VERTEX_INPUT_RATE_VERTEX }
    };
    config.attributes = {
        VkVertexInputAttributeDescription { 0, 0, VK_FORMAT_R32G32B32_SFLOAT, offsetof(Vertex, position) },
        VkVertexInputAttributeDescription { 1, 0, VK_FORMAT_R32G32B32_SFLOAT, offsetof(Vertex, normal) },
        VkVertexInputAttributeDescription { 2, 0, VK_FORMAT_R32G32_SFLOAT, offsetof(Vertex, texCoord) },
        VkVertexInputAttributeDescription { 3, 1, VK_FORMAT_R32G32B32_SFLOAT, offsetof(MorphVertex, position0) },
        VkVertexInputAttributeDescription { 4, 1, VK_FORMAT_R32G32B32_SFLOAT, offsetof(MorphVertex, normal0) },
        VkVertexInputAttributeDescription { 5, 1, VK_FORMAT_R32G32B32_SFLOAT, offsetof(MorphVertex, position1) },
        VkVertexInputAttributeDescription { 6, 1, VK_FORMAT_R32G32B32_SFLOAT, offsetof(MorphVertex, normal1) }
    };
    config.setLayouts = { cameraLayout };
    config.pushConstantRange = VkPushConstantRange {
        VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT, 0, sizeof(FurPushConstants)
    };
    config.colorFormat = colorFormat;
    config.depthFormat = depthFormat;
    config.topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
    config.cullMode = VK_CULL_MODE_NONE;
    config.depthTest = true;
    config.depthWrite = true;
    config.depthCompare = VK_COMPARE_OP_LESS;

    pipeline = context.createGraphicsPipeline(config);

    // modules are baked into the pipeline
    context.destroyShaderModule(vertModule);
    context.destroyShaderModule(fragModule);

    printf("[FurRenderer] pipeline ready, layers=%u\n", layerCount);
}

FurRenderer::~FurRenderer() {
    context.destroyPipeline(pipeline);
}

void FurRenderer::draw(RenderPass& pass, const Mesh& mesh, const CameraBinding& camera) const {
    FurPushConstants constants{};
    constants.layerCount = layerCount;
    constants.furLength = params.furLength;
    constants.density = params.density;
    constants.morphWeights = mesh.hasMorphTargets() ? params.morphWeights : glm::vec2(0.0f);

    pass.bindPipeline(pipeline);
    pass.bindDescriptorSet(pipeline, 0, camera.getDescriptorSet());
    pass.pushConstants(pipeline, VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT, sizeof(constants), &constants);
    pass.bindIndexBuffer(mesh.getIndexBuffer(), mesh.getIndexType());
    pass.bindVertexBuffer(0, mesh.getVertexBuffer());
    pass.bindVertexBuffer(1, mesh.getMorphBuffer());
    pass.drawIndexed(mesh.getIndexCount(), layerCount);
}
