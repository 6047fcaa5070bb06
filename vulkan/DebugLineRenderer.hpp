#pragma once

#include "GraphicsContext.hpp"
#include "CameraBinding.hpp"
#include "StagedBuffer.hpp"
#include <glm/glm.hpp>

struct DebugVertex {
    glm::vec3 position;
    glm::vec3 color;
};

// Line-list overlay fed from a pair of staged buffers. Every pushed vertex
// gets the next index, so consecutive pushes form connected line pairs.
class DebugLineRenderer {
public:
    // Open write transaction over both buffers
    class DebugBatch {
    public:
        DebugBatch(DebugBatch&&) noexcept = default;
        DebugBatch(const DebugBatch&) = delete;
        DebugBatch& operator=(const DebugBatch&) = delete;

        void pushVertex(const glm::vec3& position, const glm::vec3& color);
        void pushLine(const glm::vec3& from, const glm::vec3& to, const glm::vec3& color);
        void close();

    private:
        friend class DebugLineRenderer;
        explicit DebugBatch(DebugLineRenderer& renderer);

        StagedBuffer<DebugVertex>::Batch vertices;
        StagedBuffer<uint32_t>::Batch indices;
        uint32_t nextIndex;
    };

    static constexpr size_t INITIAL_CAPACITY = 64;

    DebugLineRenderer(GraphicsContext& context, VkFormat colorFormat, VkFormat depthFormat,
                      VkDescriptorSetLayout cameraLayout);
    ~DebugLineRenderer();

    DebugLineRenderer(const DebugLineRenderer&) = delete;
    DebugLineRenderer& operator=(const DebugLineRenderer&) = delete;

    DebugBatch beginBatch();
    void clear();
    void draw(RenderPass& pass, const CameraBinding& camera) const;

    const StagedBuffer<DebugVertex>& getVertices() const { return vertexBuffer; }
    const StagedBuffer<uint32_t>& getIndices() const { return indexBuffer; }
    const Pipeline& getPipeline() const { return pipeline; }

private:
    GraphicsContext& context;
    StagedBuffer<DebugVertex> vertexBuffer;
    StagedBuffer<uint32_t> indexBuffer;
    Pipeline pipeline;
};
