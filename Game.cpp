#include "Game.hpp"
#include "events/InputEvents.hpp"
#include "events/WindowEvents.hpp"
#include <iostream>
#include <stdexcept>

Game::Game(GraphicsContext& context_, AppWindow& window_, const GameConfig& config)
    : context(context_), window(window_), preferredMonitor(config.monitor),
      mouseSensitivity(config.mouseSensitivity) {
    if (config.fullscreen) {
        window.setFullscreen(true, config.monitor);
    } else {
        window.requestSize(config.width, config.height);
    }
}

Game::~Game() {
    if (state != GameState::Uninitialized) {
        context.waitIdle();
    }
    if (depthTarget.image != VK_NULL_HANDLE) {
        context.destroyDepthTarget(depthTarget);
    }
}

void Game::start(const MeshData& meshData) {
    if (state != GameState::Uninitialized) {
        throw std::logic_error("game already started");
    }

    WindowExtent size = window.getFramebufferSize();
    minimized = size.width == 0 || size.height == 0;
    if (!minimized) {
        context.configureSurface(size.width, size.height);
    }
    VkExtent2D extent = context.getSurfaceExtent();
    if (extent.width == 0 || extent.height == 0) {
        throw std::runtime_error("failed to start: surface has no extent!");
    }

    camera = Camera::lookAt(glm::vec3(0.0f, 0.0f, 4.0f), glm::vec3(0.0f), static_cast<float>(extent.width),
                            static_cast<float>(extent.height), 1.0f, 0.1f, 100.0f);
    depthTarget = context.createDepthTarget(extent.width, extent.height);

    cameraBinder = std::make_unique<CameraBinder>(context);
    cameraBinding = std::make_unique<CameraBinding>(context, *cameraBinder);
    mesh = Mesh::create(context, meshData);
    fur = std::make_unique<FurRenderer>(context, FUR_LAYERS, context.getSurfaceFormat(), depthTarget.format,
                                        cameraBinder->getLayout());
    debugLines = std::make_unique<DebugLineRenderer>(context, context.getSurfaceFormat(), depthTarget.format,
                                                     cameraBinder->getLayout());

    state = GameState::Running;
    std::cerr << "[Game] running " << extent.width << "x" << extent.height << std::endl;
}

void Game::render() {
    if (state != GameState::Running || minimized) return;

    FrameTarget target;
    SurfaceStatus status = context.acquireFrame(target);
    if (status == SurfaceStatus::Outdated || status == SurfaceStatus::Lost) {
        std::cerr << "[Game] surface " << toString(status) << ", reconfiguring" << std::endl;
        reconfigureSurface();
        return;
    }
    if (status != SurfaceStatus::Ok) {
        std::cerr << "[Game] failed to acquire frame: " << toString(status) << std::endl;
        stop();
        return;
    }

    double now = window.getTime();
    float dt = lastFrameTime ? static_cast<float>(now - *lastFrameTime) : 0.0f;
    lastFrameTime = now;
    lastDeltaTime = dt;

    applyNavigation(dt);
    cameraBinding->update(camera);

    if (debugOverlay) {
        buildDebugLines();
    } else if (!debugLines->getIndices().empty()) {
        debugLines->clear();
    }

    buildUi();

    {
        std::unique_ptr<RenderPass> pass = context.beginRenderPass(target, depthTarget,
                                                                     glm::vec4(0.0f, 0.0f, 0.0f, 1.0f), 1.0f);
        fur->draw(*pass, *mesh, *cameraBinding);
        debugLines->draw(*pass, *cameraBinding);
        drawUi(*pass);
    }

    context.submit(target);
    ++frameCount;

    status = context.present(target);
    if (status == SurfaceStatus::Outdated || status == SurfaceStatus::Lost) {
        std::cerr << "[Game] present " << toString(status) << ", reconfiguring" << std::endl;
        reconfigureSurface();
    } else if (status != SurfaceStatus::Ok) {
        std::cerr << "[Game] failed to present frame: " << toString(status) << std::endl;
        stop();
    }
}

void Game::applyNavigation(float dt) {
    camera.walkForward((forward - backward) * dt);
    camera.walkRight((right - left) * dt);
    camera.levitateUp((up - down) * dt);
}

void Game::buildDebugLines() {
    debugLines->clear();
    DebugLineRenderer::DebugBatch batch = debugLines->beginBatch();
    batch.pushLine(glm::vec3(0.0f), glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(1.0f, 0.0f, 0.0f));
    batch.pushLine(glm::vec3(0.0f), glm::vec3(0.0f, 1.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f));
    batch.pushLine(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, 1.0f), glm::vec3(0.0f, 0.0f, 1.0f));
}

void Game::reconfigureSurface() {
    WindowExtent size = window.getFramebufferSize();
    if (size.width == 0 || size.height == 0) {
        minimized = true;
        return;
    }
    context.configureSurface(size.width, size.height);

    // the surface may have come back at a different size than the depth target
    VkExtent2D extent = context.getSurfaceExtent();
    if (extent.width != depthTarget.width || extent.height != depthTarget.height) {
        camera.resize(extent.width, extent.height);
        rebuildDepthTarget(extent.width, extent.height);
    }
}

void Game::rebuildDepthTarget(uint32_t width, uint32_t height) {
    if (depthTarget.image != VK_NULL_HANDLE) {
        context.destroyDepthTarget(depthTarget);
    }
    depthTarget = context.createDepthTarget(width, height);
}

void Game::resize(uint32_t width, uint32_t height) {
    if (state == GameState::Stopped) return;
    if (width == 0 || height == 0) {
        minimized = true;
        return;
    }
    if (minimized) {
        // elapsed time must not include the time spent minimized
        lastFrameTime.reset();
    }
    minimized = false;

    context.configureSurface(width, height);
    VkExtent2D extent = context.getSurfaceExtent();
    camera.resize(extent.width, extent.height);
    if (state == GameState::Running) {
        rebuildDepthTarget(extent.width, extent.height);
    }
}

void Game::toggleFullscreen() {
    window.setFullscreen(!window.isFullscreen(), preferredMonitor);
}

void Game::stop() {
    if (state == GameState::Stopped) return;
    state = GameState::Stopped;
    if (looking) {
        looking = false;
        window.setCursorVisible(true);
    }
    std::cerr << "[Game] stopped after " << frameCount << " frames" << std::endl;
}

GameConfig Game::exportConfig() const {
    GameConfig config;
    WindowExtent size = window.getWindowSize();
    config.fullscreen = window.isFullscreen();
    std::optional<std::string> monitor = window.getMonitorName();
    config.monitor = monitor ? monitor : preferredMonitor;
    config.mouseSensitivity = mouseSensitivity;
    if (size.width > 0 && size.height > 0) {
        config.width = size.width;
        config.height = size.height;
    }
    return config;
}

void Game::onEvent(const EventPtr &event) {
    if (!event) return;

    if (const ActionEvent* action = event->as<ActionEvent>()) {
        float speed = action->pressed ? MOVE_SPEED : 0.0f;
        switch (action->action) {
            case InputAction::MoveForward: forward = speed; break;
            case InputAction::MoveBackward: backward = speed; break;
            case InputAction::MoveRight: right = speed; break;
            case InputAction::MoveLeft: left = speed; break;
            case InputAction::MoveUp: up = speed; break;
            case InputAction::MoveDown: down = speed; break;
            case InputAction::ToggleFullscreen:
                if (action->pressed) toggleFullscreen();
                break;
            case InputAction::Quit:
                if (action->pressed) stop();
                break;
            case InputAction::ToggleDebugOverlay:
                if (action->pressed) debugOverlay = !debugOverlay;
                break;
        }
        return;
    }

    if (const MouseButtonEvent* button = event->as<MouseButtonEvent>()) {
        if (button->button != MouseButtonEvent::LEFT) return;
        if (button->pressed) {
            if (looking || uiCapturesMouse()) return;
            looking = true;
            window.setCursorVisible(false);
        } else if (looking) {
            looking = false;
            window.setCursorVisible(true);
        }
        return;
    }

    if (const PointerMotionEvent* motion = event->as<PointerMotionEvent>()) {
        if (!looking) return;
        camera.rotateRight(static_cast<float>(motion->dx) * mouseSensitivity);
        camera.rotateUp(static_cast<float>(-motion->dy) * mouseSensitivity);
        return;
    }

    if (const WindowResizeEvent* resized = event->as<WindowResizeEvent>()) {
        resize(resized->width, resized->height);
        return;
    }

    if (event->as<CloseWindowEvent>()) {
        stop();
    }
}
