#pragma once

#include "GraphicsContext.hpp"
#include "CameraBinding.hpp"
#include "Mesh.hpp"
#include <glm/glm.hpp>

// Instanced fur shells: the mesh is drawn layerCount times in one indexed
// draw and the vertex stage pushes every instance outward along the normal.
class FurRenderer {
public:
    struct Params {
        float furLength = 0.15f;
        float density = 64.0f;
        glm::vec2 morphWeights{0.0f, 0.0f};
    };

    FurRenderer(GraphicsContext& context, uint32_t layerCount, VkFormat colorFormat, VkFormat depthFormat,
                VkDescriptorSetLayout cameraLayout);
    ~FurRenderer();

    FurRenderer(const FurRenderer&) = delete;
    FurRenderer& operator=(const FurRenderer&) = delete;

    void draw(RenderPass& pass, const Mesh& mesh, const CameraBinding& camera) const;

    uint32_t getLayerCount() const { return layerCount; }
    const Pipeline& getPipeline() const { return pipeline; }

    Params params;

private:
    GraphicsContext& context;
    uint32_t layerCount;
    Pipeline pipeline;
};
