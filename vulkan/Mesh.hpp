#pragma once

#include "GraphicsContext.hpp"
#include "../utils/MeshData.hpp"
#include <memory>

// Immutable GPU-resident mesh. The morph buffer always exists so the fur
// pipeline has a fixed vertex layout; it holds zero deltas when the asset
// carries no morph targets.
class Mesh {
public:
    static std::unique_ptr<Mesh> create(GraphicsContext& context, const MeshData& data);
    ~Mesh();

    Mesh(const Mesh&) = delete;
    Mesh& operator=(const Mesh&) = delete;

    const Buffer& getVertexBuffer() const { return vertexBuffer; }
    const Buffer& getIndexBuffer() const { return indexBuffer; }
    const Buffer& getMorphBuffer() const { return morphBuffer; }
    VkIndexType getIndexType() const { return indexType; }
    uint32_t getIndexCount() const { return indexCount; }
    uint32_t getVertexCount() const { return vertexCount; }
    bool hasMorphTargets() const { return morphTargets; }

private:
    explicit Mesh(GraphicsContext& context);

    GraphicsContext& context;
    Buffer vertexBuffer;
    Buffer indexBuffer;
    Buffer morphBuffer;
    VkIndexType indexType = VK_INDEX_TYPE_UINT32;
    uint32_t indexCount = 0;
    uint32_t vertexCount = 0;
    bool morphTargets = false;
};
