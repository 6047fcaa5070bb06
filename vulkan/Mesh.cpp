#include "Mesh.hpp"
#include <stdexcept>
#include <limits>
#include <string>
#include <iostream>

Mesh::Mesh(GraphicsContext& context_) : context(context_) {}

Mesh::~Mesh() {
    if (vertexBuffer.buffer != VK_NULL_HANDLE) context.destroyBuffer(vertexBuffer);
    if (indexBuffer.buffer != VK_NULL_HANDLE) context.destroyBuffer(indexBuffer);
    if (morphBuffer.buffer != VK_NULL_HANDLE) context.destroyBuffer(morphBuffer);
}

std::unique_ptr<Mesh> Mesh::create(GraphicsContext& context, const MeshData& data) {
    if (data.vertices.empty()) {
        throw std::runtime_error("mesh has no vertices");
    }
    if (data.indices.empty()) {
        throw std::runtime_error("mesh has no indices");
    }
    if (data.hasMorphTargets() && data.morphs.size() != data.vertices.size()) {
        throw std::runtime_error("morph target count does not match vertex count");
    }
    for (uint32_t index : data.indices) {
        if (index >= data.vertices.size()) {
            throw std::runtime_error("mesh index " + std::to_string(index) + " out of range");
        }
    }

    std::unique_ptr<Mesh> mesh(new Mesh(context));
    mesh->vertexCount = static_cast<uint32_t>(data.vertices.size());
    mesh->indexCount = static_cast<uint32_t>(data.indices.size());
    mesh->morphTargets = data.hasMorphTargets();

    mesh->vertexBuffer = context.createDeviceLocalBuffer(
        data.vertices.data(), sizeof(Vertex) * data.vertices.size(), VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);

    if (data.indexWidth == IndexWidth::U16) {
        std::vector<uint16_t> narrow;
        narrow.reserve(data.indices.size());
        for (uint32_t index : data.indices) {
            if (index > std::numeric_limits<uint16_t>::max()) {
                throw std::runtime_error("16-bit mesh index out of range");
            }
            narrow.push_back(static_cast<uint16_t>(index));
        }
        mesh->indexType = VK_INDEX_TYPE_UINT16;
        mesh->indexBuffer = context.createDeviceLocalBuffer(
            narrow.data(), sizeof(uint16_t) * narrow.size(), VK_BUFFER_USAGE_INDEX_BUFFER_BIT);
    } else {
        mesh->indexType = VK_INDEX_TYPE_UINT32;
        mesh->indexBuffer = context.createDeviceLocalBuffer(
            data.indices.data(), sizeof(uint32_t) * data.indices.size(), VK_BUFFER_USAGE_INDEX_BUFFER_BIT);
    }

    if (mesh->morphTargets) {
        mesh->morphBuffer = context.createDeviceLocalBuffer(
            data.morphs.data(), sizeof(MorphVertex) * data.morphs.size(), VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);
    } else {
        MorphVertex none{glm::vec3(0.0f), glm::vec3(0.0f), glm::vec3(0.0f), glm::vec3(0.0f)};
        std::vector<MorphVertex> zero(data.vertices.size(), none);
        mesh->morphBuffer = context.createDeviceLocalBuffer(
            zero.data(), sizeof(MorphVertex) * zero.size(), VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);
    }

    std::cerr << "[Mesh] uploaded vertices=" << mesh->vertexCount << " indices=" << mesh->indexCount
              << (mesh->indexType == VK_INDEX_TYPE_UINT16 ? " (u16)" : " (u32)")
              << (mesh->morphTargets ? " with 2 morph targets" : "") << std::endl;
    return mesh;
}
