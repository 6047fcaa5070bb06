#include "WidgetManager.hpp"
#include <imgui.h>

void WidgetManager::addWidget(std::unique_ptr<Widget> widget) {
	if (widget) widgets.push_back(std::move(widget));
}

void WidgetManager::renderAll() {
	for (auto& widget : widgets) {
		if (widget->isVisible()) {
			widget->render();
		}
	}
}

void WidgetManager::renderMenu() {
	if (ImGui::BeginMenu("Windows")) {
		for (auto& widget : widgets) {
			bool open = widget->isVisible();
			if (ImGui::MenuItem(widget->getTitle().c_str(), nullptr, &open)) {
				widget->setVisible(open);
			}
		}
		ImGui::EndMenu();
	}
}

Widget* WidgetManager::getWidget(const std::string& title) const {
	for (auto& widget : widgets) {
		if (widget->getTitle() == title) {
			return widget.get();
		}
	}
	return nullptr;
}
