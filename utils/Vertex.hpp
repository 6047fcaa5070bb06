#pragma once

#include <glm/glm.hpp>

// Mesh vertex as laid out in the vertex buffer (binding 0)
struct Vertex {
    glm::vec3 position;
    glm::vec3 normal;
    glm::vec2 texCoord;
};

// Per-vertex deltas of the two morph targets (binding 1)
struct MorphVertex {
    glm::vec3 position0;
    glm::vec3 normal0;
    glm::vec3 position1;
    glm::vec3 normal1;
};
