#include "SettingsWidget.hpp"
#include "../Game.hpp"
#include <imgui.h>

SettingsWidget::SettingsWidget(Game& game_) : Widget("Settings", true), game(game_) {}

void SettingsWidget::render() {
    if (ImGui::Begin(title.c_str(), &isOpen)) {
        ImGui::Text("Fur");
        ImGui::Separator();
        FurRenderer* fur = game.getFurRenderer();
        if (fur) {
            ImGui::Text("Layers: %u", fur->getLayerCount());
            ImGui::SliderFloat("Fur Length", &fur->params.furLength, 0.0f, 1.0f, "%.3f");
            if (ImGui::IsItemHovered()) ImGui::SetTooltip("Offset of the outermost shell along the normal");
            ImGui::SliderFloat("Density", &fur->params.density, 1.0f, 512.0f, "%.0f");
            if (ImGui::IsItemHovered()) ImGui::SetTooltip("Strands per UV unit");
            const Mesh* mesh = game.getMesh();
            if (mesh && mesh->hasMorphTargets()) {
                ImGui::SliderFloat("Morph 0", &fur->params.morphWeights.x, 0.0f, 1.0f);
                ImGui::SliderFloat("Morph 1", &fur->params.morphWeights.y, 0.0f, 1.0f);
            } else {
                ImGui::TextDisabled("Mesh has no morph targets");
            }
        } else {
            ImGui::TextDisabled("Not started");
        }

        ImGui::Separator();
        ImGui::Text("Input");
        ImGui::Separator();
        float sensitivity = game.getMouseSensitivity();
        if (ImGui::SliderFloat("Mouse Sensitivity", &sensitivity, 0.001f, 0.5f, "%.3f")) {
            game.setMouseSensitivity(sensitivity);
        }
        if (ImGui::IsItemHovered()) ImGui::SetTooltip("Radians of rotation per pointer unit");

        ImGui::Separator();
        bool overlay = game.isDebugOverlayEnabled();
        if (ImGui::Checkbox("Debug Lines (F3)", &overlay)) {
            game.setDebugOverlay(overlay);
        }
        if (ImGui::IsItemHovered()) ImGui::SetTooltip("Draw the world axes at the origin");
    }
    ImGui::End();
}
