#include "Camera.hpp"
#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>
#include <cmath>

static const glm::vec3 WORLD_UP(0.0f, 1.0f, 0.0f);

Camera::Camera()
    : position(0.0f), yaw(0.0f), pitch(0.0f), fovY(1.0f), aspect(1.0f), near(0.1f), far(100.0f) {
}

Camera Camera::lookAt(const glm::vec3& eye, const glm::vec3& target, float aspectW, float aspectH,
                      float fovY, float near, float far) {
    Camera camera;
    camera.position = eye;
    camera.fovY = fovY;
    camera.near = near;
    camera.far = far;
    if (aspectH > 0.0f) camera.aspect = aspectW / aspectH;

    glm::vec3 d = target - eye;
    if (glm::dot(d, d) > 0.0f) {
        d = glm::normalize(d);
        // forward at yaw = pitch = 0 is -Z
        camera.pitch = std::asin(std::clamp(d.y, -1.0f, 1.0f));
        camera.yaw = std::atan2(-d.x, -d.z);
    }
    return camera;
}

void Camera::resize(uint32_t width, uint32_t height) {
    if (height == 0) return;
    aspect = static_cast<float>(width) / static_cast<float>(height);
}

void Camera::walkForward(float delta) {
    position += getForward() * delta;
}

void Camera::walkRight(float delta) {
    position += getRight() * delta;
}

void Camera::levitateUp(float delta) {
    position += getUp() * delta;
}

void Camera::rotateRight(float delta) {
    // positive yaw turns left around world up
    yaw -= delta;
}

void Camera::rotateUp(float delta) {
    pitch += delta;
}

glm::quat Camera::getOrientation() const {
    glm::quat yawRotation = glm::angleAxis(yaw, WORLD_UP);
    glm::quat pitchRotation = glm::angleAxis(pitch, glm::vec3(1.0f, 0.0f, 0.0f));
    return glm::normalize(yawRotation * pitchRotation);
}

glm::vec3 Camera::getForward() const {
    return glm::normalize(getOrientation() * glm::vec3(0.0f, 0.0f, -1.0f));
}

glm::vec3 Camera::getRight() const {
    return glm::normalize(getOrientation() * glm::vec3(1.0f, 0.0f, 0.0f));
}

glm::vec3 Camera::getUp() const {
    return glm::normalize(getOrientation() * glm::vec3(0.0f, 1.0f, 0.0f));
}

glm::mat4 Camera::getViewMatrix() const {
    return glm::lookAt(position, position + getForward(), getUp());
}

glm::mat4 Camera::getProjectionMatrix() const {
    glm::mat4 proj = glm::perspective(fovY, aspect, near, far);
    proj[1][1] *= -1;
    return proj;
}

glm::mat4 Camera::getViewProjection() const {
    return getProjectionMatrix() * getViewMatrix();
}
