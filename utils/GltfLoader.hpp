#pragma once

#include "MeshData.hpp"
#include <string>

namespace tinygltf {
class Model;
}

// Reads a single-mesh glTF asset (binary .glb or text .gltf) into MeshData.
// Any asset that is not exactly one mesh with one triangle primitive carrying
// POSITION, NORMAL, TEXCOORD_0 and u16/u32 indices is rejected with a
// std::runtime_error. Morph targets are optional but must come as a pair.
class GltfLoader {
public:
    static MeshData load(const std::string& path);
    static MeshData fromModel(const tinygltf::Model& model);
};
