#ifndef CAMERA_HPP
#define CAMERA_HPP

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cstdint>

// Fly camera. Orientation is yaw about world up followed by pitch about the
// local right axis; neither angle is clamped, so pitching past the poles
// turns the view upside down.
class Camera {
public:
    Camera();

    // fovY is the vertical field of view in radians
    static Camera lookAt(const glm::vec3& eye, const glm::vec3& target, float aspectW, float aspectH,
                         float fovY, float near, float far);

    void resize(uint32_t width, uint32_t height);

    // translate along the local axes by a signed, time-scaled amount
    void walkForward(float delta);
    void walkRight(float delta);
    void levitateUp(float delta);

    // radians
    void rotateRight(float delta);
    void rotateUp(float delta);

    glm::vec3 getPosition() const { return position; }
    void setPosition(const glm::vec3& p) { position = p; }
    glm::quat getOrientation() const;
    glm::vec3 getForward() const;
    glm::vec3 getRight() const;
    glm::vec3 getUp() const;

    float getYaw() const { return yaw; }
    float getPitch() const { return pitch; }
    float getFovY() const { return fovY; }
    float getAspect() const { return aspect; }
    float getNear() const { return near; }
    float getFar() const { return far; }

    glm::mat4 getViewMatrix() const;
    glm::mat4 getProjectionMatrix() const;
    glm::mat4 getViewProjection() const;

private:
    glm::vec3 position;
    float yaw;
    float pitch;
    float fovY;
    float aspect;
    float near;
    float far;
};

#endif
