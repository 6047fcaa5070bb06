#pragma once

#include <glm/glm.hpp>
#include <cstdint>

// Camera uniform (set 0, binding 0) shared by every draw in a frame
struct CameraUniform {
    glm::mat4 viewProjection;
    glm::vec4 position; // xyz = world-space eye, w = unused
};

// Fur shell parameters pushed per draw
struct FurPushConstants {
    uint32_t layerCount;
    float furLength;
    float density;
    float padding;
    glm::vec2 morphWeights; // x = target 0, y = target 1
};
