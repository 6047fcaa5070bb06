#pragma once

#include "vulkan/GraphicsContext.hpp"
#include "vulkan/CameraBinding.hpp"
#include "vulkan/Mesh.hpp"
#include "vulkan/FurRenderer.hpp"
#include "vulkan/DebugLineRenderer.hpp"
#include "math/Camera.hpp"
#include "events/IEventHandler.hpp"
#include "window/AppWindow.hpp"
#include "utils/GameConfig.hpp"
#include "utils/MeshData.hpp"
#include <memory>
#include <optional>

enum class GameState {
    Uninitialized,
    Running,
    Stopped
};

inline const char* toString(GameState state) {
    switch (state) {
        case GameState::Uninitialized: return "uninitialized";
        case GameState::Running: return "running";
        case GameState::Stopped: return "stopped";
    }
    return "unknown";
}

// Frame loop driver. Owns the depth target, camera, mesh and render
// techniques; the context and window are borrowed from the caller and must
// outlive the Game. Stopped is terminal.
class Game : public IEventHandler {
public:
    static constexpr uint32_t FUR_LAYERS = 32;
    static constexpr float MOVE_SPEED = 0.5f; // units per second per held key

    Game(GraphicsContext& context, AppWindow& window, const GameConfig& config);
    virtual ~Game();

    Game(const Game&) = delete;
    Game& operator=(const Game&) = delete;

    // Builds every GPU resource and enters Running
    void start(const MeshData& meshData);

    // One frame: acquire, update, record, submit, present
    void render();

    // Safe between any two frames; zero extents mark the window minimized
    void resize(uint32_t width, uint32_t height);

    void toggleFullscreen();
    void stop();

    GameConfig exportConfig() const;

    void onEvent(const EventPtr &event) override;

    GameState getState() const { return state; }
    bool isRunning() const { return state == GameState::Running; }
    bool isMinimized() const { return minimized; }
    bool isLooking() const { return looking; }

    Camera& getCamera() { return camera; }
    const Camera& getCamera() const { return camera; }
    const DepthTarget& getDepthTarget() const { return depthTarget; }
    const Mesh* getMesh() const { return mesh.get(); }
    FurRenderer* getFurRenderer() { return fur.get(); }
    const DebugLineRenderer* getDebugLines() const { return debugLines.get(); }

    float getMouseSensitivity() const { return mouseSensitivity; }
    void setMouseSensitivity(float sensitivity) { mouseSensitivity = sensitivity; }
    bool isDebugOverlayEnabled() const { return debugOverlay; }
    void setDebugOverlay(bool enabled) { debugOverlay = enabled; }

    uint64_t getFrameCount() const { return frameCount; }
    float getLastDeltaTime() const { return lastDeltaTime; }

protected:
    // UI hooks: buildUi runs before the render pass opens, drawUi inside it
    virtual void buildUi() {}
    virtual void drawUi(RenderPass& pass) { (void)pass; }
    virtual bool uiCapturesMouse() const { return false; }

    GraphicsContext& context;
    AppWindow& window;

private:
    void applyNavigation(float dt);
    void buildDebugLines();
    void reconfigureSurface();
    void rebuildDepthTarget(uint32_t width, uint32_t height);

    GameState state = GameState::Uninitialized;
    std::optional<std::string> preferredMonitor;

    Camera camera;
    DepthTarget depthTarget;
    std::unique_ptr<CameraBinder> cameraBinder;
    std::unique_ptr<CameraBinding> cameraBinding;
    std::unique_ptr<Mesh> mesh;
    std::unique_ptr<FurRenderer> fur;
    std::unique_ptr<DebugLineRenderer> debugLines;

    std::optional<double> lastFrameTime;
    float lastDeltaTime = 0.0f;
    uint64_t frameCount = 0;

    // held-key speeds, opposite pairs cancel
    float forward = 0.0f;
    float backward = 0.0f;
    float left = 0.0f;
    float right = 0.0f;
    float up = 0.0f;
    float down = 0.0f;

    float mouseSensitivity;
    bool looking = false;
    bool minimized = false;
    bool debugOverlay = false;
};
