#pragma once

#include "Vertex.hpp"
#include <vector>
#include <cstdint>

enum class IndexWidth {
    U16,
    U32
};

// Raw mesh arrays as produced by an asset loader
struct MeshData {
    std::vector<Vertex> vertices;
    std::vector<uint32_t> indices;
    IndexWidth indexWidth = IndexWidth::U32;
    // empty, or one entry per vertex when the asset carries two morph targets
    std::vector<MorphVertex> morphs;

    bool hasMorphTargets() const { return !morphs.empty(); }
};
