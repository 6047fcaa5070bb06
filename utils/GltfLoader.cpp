#define TINYGLTF_IMPLEMENTATION
#include <tiny_gltf.h>

#include "GltfLoader.hpp"
#include <stdexcept>
#include <iostream>
#include <cstring>
#include <algorithm>
#include <cctype>

// Textures are never sampled; keep images undecoded.
static bool skipImageData(tinygltf::Image*, const int, std::string*, std::string*, int, int,
                          const unsigned char*, int, void*) {
    return true;
}

static const unsigned char* accessorData(const tinygltf::Model& model, const tinygltf::Accessor& accessor,
                                         size_t elementSize, size_t& stride, const std::string& label) {
    if (accessor.sparse.isSparse) {
        throw std::runtime_error("glTF: sparse accessor not supported for " + label);
    }
    if (accessor.bufferView < 0 || accessor.bufferView >= static_cast<int>(model.bufferViews.size())) {
        throw std::runtime_error("glTF: invalid bufferView for " + label);
    }

    const tinygltf::BufferView& view = model.bufferViews[accessor.bufferView];
    if (view.buffer < 0 || view.buffer >= static_cast<int>(model.buffers.size())) {
        throw std::runtime_error("glTF: invalid buffer index for " + label);
    }
    const tinygltf::Buffer& buf = model.buffers[view.buffer];

    stride = view.byteStride > 0 ? static_cast<size_t>(view.byteStride) : elementSize;
    if (stride < elementSize) {
        throw std::runtime_error("glTF: invalid stride for " + label);
    }

    const size_t baseOffset = static_cast<size_t>(view.byteOffset) + static_cast<size_t>(accessor.byteOffset);
    const size_t count = static_cast<size_t>(accessor.count);
    if (count > 0 && baseOffset + (count - 1) * stride + elementSize > buf.data.size()) {
        throw std::runtime_error("glTF: buffer range out of bounds for " + label);
    }
    return buf.data.data() + baseOffset;
}

template <typename V>
static std::vector<V> readFloats(const tinygltf::Model& model, int accessorIndex, int type, const std::string& label) {
    if (accessorIndex < 0 || accessorIndex >= static_cast<int>(model.accessors.size())) {
        throw std::runtime_error("glTF: invalid accessor for " + label);
    }
    const tinygltf::Accessor& accessor = model.accessors[accessorIndex];
    if (accessor.componentType != TINYGLTF_COMPONENT_TYPE_FLOAT || accessor.type != type) {
        throw std::runtime_error("glTF: unexpected component layout for " + label);
    }

    size_t stride = 0;
    const unsigned char* data = accessorData(model, accessor, sizeof(V), stride, label);

    std::vector<V> out(static_cast<size_t>(accessor.count));
    for (size_t i = 0; i < out.size(); ++i) {
        std::memcpy(&out[i], data + i * stride, sizeof(V));
    }
    return out;
}

static std::vector<uint32_t> readIndices(const tinygltf::Model& model, int accessorIndex, IndexWidth& width) {
    if (accessorIndex < 0 || accessorIndex >= static_cast<int>(model.accessors.size())) {
        throw std::runtime_error("glTF: primitive has no index accessor");
    }
    const tinygltf::Accessor& accessor = model.accessors[accessorIndex];
    if (accessor.type != TINYGLTF_TYPE_SCALAR) {
        throw std::runtime_error("glTF: indices accessor must be SCALAR");
    }

    size_t elementSize = 0;
    switch (accessor.componentType) {
        case TINYGLTF_COMPONENT_TYPE_UNSIGNED_SHORT:
            width = IndexWidth::U16;
            elementSize = sizeof(uint16_t);
            break;
        case TINYGLTF_COMPONENT_TYPE_UNSIGNED_INT:
            width = IndexWidth::U32;
            elementSize = sizeof(uint32_t);
            break;
        default:
            throw std::runtime_error("glTF: unsupported index component type " + std::to_string(accessor.componentType));
    }

    size_t stride = 0;
    const unsigned char* data = accessorData(model, accessor, elementSize, stride, "indices");

    std::vector<uint32_t> out(static_cast<size_t>(accessor.count));
    for (size_t i = 0; i < out.size(); ++i) {
        const unsigned char* p = data + i * stride;
        if (width == IndexWidth::U16) {
            uint16_t v;
            std::memcpy(&v, p, sizeof(v));
            out[i] = v;
        } else {
            uint32_t v;
            std::memcpy(&v, p, sizeof(v));
            out[i] = v;
        }
    }
    return out;
}

static int requireAttribute(const std::map<std::string, int>& attributes, const std::string& name, const std::string& owner) {
    auto it = attributes.find(name);
    if (it == attributes.end()) {
        throw std::runtime_error("glTF: " + owner + " is missing " + name);
    }
    return it->second;
}

MeshData GltfLoader::fromModel(const tinygltf::Model& model) {
    if (model.meshes.size() != 1) {
        throw std::runtime_error("glTF: expected exactly one mesh, found " + std::to_string(model.meshes.size()));
    }
    const tinygltf::Mesh& gm = model.meshes[0];
    if (gm.primitives.size() != 1) {
        throw std::runtime_error("glTF: expected exactly one primitive, found " + std::to_string(gm.primitives.size()));
    }
    const tinygltf::Primitive& prim = gm.primitives[0];
    if (prim.mode != -1 && prim.mode != TINYGLTF_MODE_TRIANGLES) {
        throw std::runtime_error("glTF: only triangle primitives are supported");
    }

    std::vector<glm::vec3> positions = readFloats<glm::vec3>(
        model, requireAttribute(prim.attributes, "POSITION", "primitive"), TINYGLTF_TYPE_VEC3, "POSITION");
    std::vector<glm::vec3> normals = readFloats<glm::vec3>(
        model, requireAttribute(prim.attributes, "NORMAL", "primitive"), TINYGLTF_TYPE_VEC3, "NORMAL");
    std::vector<glm::vec2> uvs = readFloats<glm::vec2>(
        model, requireAttribute(prim.attributes, "TEXCOORD_0", "primitive"), TINYGLTF_TYPE_VEC2, "TEXCOORD_0");

    if (normals.size() != positions.size() || uvs.size() != positions.size()) {
        throw std::runtime_error("glTF: attribute counts differ");
    }

    MeshData data;
    data.vertices.reserve(positions.size());
    for (size_t i = 0; i < positions.size(); ++i) {
        data.vertices.push_back(Vertex{positions[i], normals[i], uvs[i]});
    }

    data.indices = readIndices(model, prim.indices, data.indexWidth);

    if (!prim.targets.empty()) {
        if (prim.targets.size() != 2) {
            throw std::runtime_error("glTF: expected 0 or 2 morph targets, found " + std::to_string(prim.targets.size()));
        }
        std::vector<glm::vec3> d0Position = readFloats<glm::vec3>(
            model, requireAttribute(prim.targets[0], "POSITION", "morph target 0"), TINYGLTF_TYPE_VEC3, "morph target 0 POSITION");
        std::vector<glm::vec3> d0Normal = readFloats<glm::vec3>(
            model, requireAttribute(prim.targets[0], "NORMAL", "morph target 0"), TINYGLTF_TYPE_VEC3, "morph target 0 NORMAL");
        std::vector<glm::vec3> d1Position = readFloats<glm::vec3>(
            model, requireAttribute(prim.targets[1], "POSITION", "morph target 1"), TINYGLTF_TYPE_VEC3, "morph target 1 POSITION");
        std::vector<glm::vec3> d1Normal = readFloats<glm::vec3>(
            model, requireAttribute(prim.targets[1], "NORMAL", "morph target 1"), TINYGLTF_TYPE_VEC3, "morph target 1 NORMAL");

        const size_t n = positions.size();
        if (d0Position.size() != n || d0Normal.size() != n || d1Position.size() != n || d1Normal.size() != n) {
            throw std::runtime_error("glTF: morph target counts differ from vertex count");
        }
        data.morphs.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            data.morphs.push_back(MorphVertex{d0Position[i], d0Normal[i], d1Position[i], d1Normal[i]});
        }
    }

    return data;
}

MeshData GltfLoader::load(const std::string& path) {
    std::string ext = path.size() >= 4 ? path.substr(path.size() - 4) : std::string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const bool isGlb = ext == ".glb";

    tinygltf::TinyGLTF loader;
    loader.SetImageLoader(skipImageData, nullptr);
    tinygltf::Model model;
    std::string err;
    std::string warn;

    bool ok = isGlb ? loader.LoadBinaryFromFile(&model, &err, &warn, path)
                    : loader.LoadASCIIFromFile(&model, &err, &warn, path);

    if (!warn.empty()) {
        std::cerr << "[GltfLoader] warning: " << warn << std::endl;
    }
    if (!ok) {
        throw std::runtime_error("failed to load glTF asset " + path + ": " + (err.empty() ? "parse failed" : err));
    }

    MeshData data = fromModel(model);
    std::cerr << "[GltfLoader] " << path << ": vertices=" << data.vertices.size()
              << " indices=" << data.indices.size()
              << " morphTargets=" << (data.hasMorphTargets() ? 2 : 0) << std::endl;
    return data;
}
