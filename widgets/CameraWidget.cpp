#include "CameraWidget.hpp"
#include <imgui.h>

CameraWidget::CameraWidget(Camera* camera_) : Widget("Camera"), camera(camera_) {}

void CameraWidget::render() {
	if (!ImGui::Begin(title.c_str(), &isOpen)) {
		ImGui::End();
		return;
	}

	glm::vec3 pos = camera->getPosition();
	if (ImGui::DragFloat3("Position", &pos.x, 0.05f)) {
		camera->setPosition(pos);
	}
	ImGui::Text("Yaw: %.1f deg  Pitch: %.1f deg", glm::degrees(camera->getYaw()), glm::degrees(camera->getPitch()));
	glm::vec3 fwd = camera->getForward();
	ImGui::Text("Forward: %.2f, %.2f, %.2f", fwd.x, fwd.y, fwd.z);
	ImGui::Separator();
	ImGui::Text("FOV: %.1f deg  Aspect: %.3f", glm::degrees(camera->getFovY()), camera->getAspect());
	ImGui::Text("Near: %.2f  Far: %.1f", camera->getNear(), camera->getFar());

	ImGui::End();
}
