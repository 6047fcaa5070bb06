#include "CameraBinding.hpp"
#include "../Uniforms.hpp"

CameraBinder::CameraBinder(GraphicsContext& context_) : context(context_) {
    layout = context.createUniformSetLayout(VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT);
}

CameraBinder::~CameraBinder() {
    if (layout != VK_NULL_HANDLE) context.destroySetLayout(layout);
}

CameraBinding::CameraBinding(GraphicsContext& context_, const CameraBinder& binder) : context(context_) {
    uniform = context.createBuffer(sizeof(CameraUniform), VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT);
    descriptorSet = context.createUniformDescriptorSet(binder.getLayout(), uniform);
}

CameraBinding::~CameraBinding() {
    if (descriptorSet != VK_NULL_HANDLE) context.freeDescriptorSet(descriptorSet);
    if (uniform.buffer != VK_NULL_HANDLE) context.destroyBuffer(uniform);
}

void CameraBinding::update(const Camera& camera) {
    CameraUniform data{};
    data.viewProjection = camera.getViewProjection();
    data.position = glm::vec4(camera.getPosition(), 1.0f);
    context.writeBuffer(uniform, 0, &data, sizeof(data));
}
