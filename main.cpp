#include "Game.hpp"
#include "vulkan/VulkanContext.hpp"
#include "vulkan/ImGuiLayer.hpp"
#include "window/GlfwWindow.hpp"
#include "events/EventManager.hpp"
#include "events/InputPublisher.hpp"
#include "utils/GameConfig.hpp"
#include "utils/GltfLoader.hpp"
#include "widgets/WidgetManager.hpp"
#include "widgets/CameraWidget.hpp"
#include "widgets/SettingsWidget.hpp"

#include <imgui.h>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

const char* CONFIG_PATH = "config.json";
const char* MODEL_PATH = "res/spherical-cube.glb";

}

class FurApp : public Game {
public:
    FurApp(VulkanContext& context, GlfwWindow& window, const GameConfig& config, ImGuiLayer& imgui_)
        : Game(context, window, config), imgui(imgui_) {
        widgetManager.addWidget(std::make_unique<CameraWidget>(&getCamera()));
        widgetManager.addWidget(std::make_unique<SettingsWidget>(*this));
    }

protected:
    void buildUi() override {
        imgui.newFrame();

        float dt = getLastDeltaTime();
        if (dt > 0.0f) {
            // smoothed so the overlay stays readable
            fps = fps <= 0.0f ? 1.0f / dt : fps * 0.95f + (1.0f / dt) * 0.05f;
        }

        if (ImGui::BeginMainMenuBar()) {
            if (ImGui::BeginMenu("File")) {
                if (ImGui::MenuItem("Exit", "Esc")) stop();
                ImGui::EndMenu();
            }
            if (ImGui::BeginMenu("View")) {
                if (ImGui::MenuItem("Fullscreen", "F11", window.isFullscreen())) {
                    toggleFullscreen();
                }
                bool overlay = isDebugOverlayEnabled();
                if (ImGui::MenuItem("Debug Lines", "F3", &overlay)) {
                    setDebugOverlay(overlay);
                }
                ImGui::MenuItem("Stats", nullptr, &showStats);
                ImGui::EndMenu();
            }
            widgetManager.renderMenu();
            ImGui::EndMainMenuBar();
        }

        if (showStats) {
            ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize |
                                     ImGuiWindowFlags_NoFocusOnAppearing | ImGuiWindowFlags_NoNav;
            ImGui::SetNextWindowBgAlpha(0.35f);
            const float padding = 10.0f;
            float y = ImGui::GetFrameHeight() + 6.0f; // just under the main menu bar
            ImGui::SetNextWindowPos(ImVec2(padding, y), ImGuiCond_Always);
            if (ImGui::Begin("##stats_overlay", nullptr, flags)) {
                glm::vec3 pos = getCamera().getPosition();
                ImGui::Text("FPS: %.1f", fps);
                ImGui::Text("Camera: %.2f, %.2f, %.2f", pos.x, pos.y, pos.z);
                ImGui::Text("Layers: %u", FUR_LAYERS);
            }
            ImGui::End();
        }

        widgetManager.renderAll();
    }

    void drawUi(RenderPass& pass) override {
        imgui.render(pass);
    }

    bool uiCapturesMouse() const override {
        return imgui.wantsMouse();
    }

private:
    ImGuiLayer& imgui;
    WidgetManager widgetManager;
    float fps = 0.0f;
    bool showStats = true;
};

int main(int argc, char** argv) {
    try {
        std::string modelPath = argc > 1 ? argv[1] : MODEL_PATH;
        GameConfig config = GameConfig::load(CONFIG_PATH);

        GlfwWindow window("FurShell", config.width, config.height);
        VulkanContext context(window.getHandle());
        MeshData meshData = GltfLoader::load(modelPath);

        EventManager eventManager;
        InputPublisher input(window.getHandle(), &eventManager);
        ImGuiLayer imgui(context, window.getHandle());

        FurApp app(context, window, config, imgui);
        eventManager.subscribe(&app);
        app.start(meshData);

        bool shown = false;
        while (app.isRunning() && !window.shouldClose()) {
            if (!shown) {
                window.show();
                shown = true;
            }
            if (app.isMinimized()) {
                window.waitEvents();
            } else {
                window.pollEvents();
            }
            eventManager.processQueued();
            app.render();
        }

        eventManager.unsubscribe(&app);
        config = app.exportConfig();
        config.save(CONFIG_PATH);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
