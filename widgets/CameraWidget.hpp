#pragma once

#include "Widget.hpp"
#include "../math/Camera.hpp"

class CameraWidget : public Widget {
public:
    explicit CameraWidget(Camera* camera);

    void render() override;

private:
    Camera* camera;
};
