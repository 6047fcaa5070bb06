#include <gtest/gtest.h>
#include "fakes/FakeGraphicsContext.hpp"
#include "fakes/FakeWindow.hpp"
#include "Game.hpp"
#include "events/InputEvents.hpp"
#include "events/WindowEvents.hpp"
#include "TestMeshes.hpp"

namespace {

class UiCapturingGame : public Game {
public:
    using Game::Game;
    bool captures = true;
protected:
    bool uiCapturesMouse() const override { return captures; }
};

}

class GameTest : public ::testing::Test {
protected:
    FakeGraphicsContext ctx;
    FakeWindow window;
    GameConfig config;

    std::unique_ptr<Game> startedGame() {
        auto game = std::make_unique<Game>(ctx, window, config);
        game->start(triangleMesh());
        return game;
    }

    void press(Game& game, InputAction action, bool pressed = true) {
        game.onEvent(make_event<ActionEvent>(action, pressed));
    }

    const PassCommand* drawWithInstances(const PassRecord& pass, uint32_t instances) {
        for (const PassCommand* draw : pass.draws()) {
            if (draw->instances == instances) return draw;
        }
        return nullptr;
    }
};

TEST_F(GameTest, AppliesWindowedConfigOnConstruction) {
    config.width = 1024;
    config.height = 768;
    Game game(ctx, window, config);
    ASSERT_EQ(window.requestedSizes.size(), 1u);
    EXPECT_EQ(window.requestedSizes[0].width, 1024u);
    EXPECT_EQ(window.requestedSizes[0].height, 768u);
    EXPECT_FALSE(window.fullscreen);
    EXPECT_EQ(game.getState(), GameState::Uninitialized);
}

TEST_F(GameTest, AppliesFullscreenConfigOnConstruction) {
    config.fullscreen = true;
    config.monitor = "HDMI-1";
    Game game(ctx, window, config);
    EXPECT_TRUE(window.fullscreen);
    EXPECT_EQ(window.requestedMonitor, std::optional<std::string>("HDMI-1"));
    EXPECT_TRUE(window.requestedSizes.empty());
}

TEST_F(GameTest, StartConfiguresSurfaceAndBuildsResources) {
    auto game = startedGame();

    EXPECT_EQ(game->getState(), GameState::Running);
    ASSERT_EQ(ctx.configureCalls.size(), 1u);
    EXPECT_EQ(ctx.configureCalls[0].width, 1280u);
    EXPECT_EQ(ctx.configureCalls[0].height, 720u);
    ASSERT_EQ(ctx.depthCreated.size(), 1u);
    EXPECT_EQ(game->getDepthTarget().width, 1280u);
    EXPECT_EQ(game->getDepthTarget().height, 720u);
    ASSERT_NE(game->getFurRenderer(), nullptr);
    EXPECT_EQ(game->getFurRenderer()->getLayerCount(), Game::FUR_LAYERS);
    EXPECT_NEAR(game->getCamera().getAspect(), 1280.0f / 720.0f, 1e-5f);
    EXPECT_NEAR(game->getCamera().getPosition().z, 4.0f, 1e-5f);
}

TEST_F(GameTest, StartTwiceIsRejected) {
    auto game = startedGame();
    EXPECT_THROW(game->start(triangleMesh()), std::logic_error);
}

TEST_F(GameTest, RenderRecordsAndPresentsOneFrame) {
    auto game = startedGame();
    game->render();

    EXPECT_EQ(ctx.acquireCount, 1);
    EXPECT_EQ(ctx.submitCount, 1);
    EXPECT_EQ(ctx.presentCount, 1);
    EXPECT_EQ(game->getFrameCount(), 1u);
    ASSERT_EQ(ctx.passes.size(), 1u);

    const PassRecord& pass = ctx.lastPass();
    EXPECT_TRUE(pass.ended);
    EXPECT_EQ(pass.clearColor, glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));
    EXPECT_FLOAT_EQ(pass.clearDepth, 1.0f);
    EXPECT_EQ(pass.depth, game->getDepthTarget().view);

    auto draws = pass.draws();
    ASSERT_EQ(draws.size(), 1u);
    EXPECT_EQ(draws[0]->count, 3u);
    EXPECT_EQ(draws[0]->instances, Game::FUR_LAYERS);
}

TEST_F(GameTest, OutdatedAcquireReconfiguresAndSkipsTheFrame) {
    auto game = startedGame();
    ctx.acquireScript = {SurfaceStatus::Outdated};
    game->render();

    EXPECT_EQ(game->getState(), GameState::Running);
    EXPECT_EQ(ctx.configureCalls.size(), 2u);
    EXPECT_TRUE(ctx.passes.empty());
    EXPECT_EQ(ctx.submitCount, 0);
    EXPECT_EQ(ctx.presentCount, 0);
    EXPECT_EQ(game->getFrameCount(), 0u);
    // same size: the depth target is kept
    EXPECT_EQ(ctx.depthCreated.size(), 1u);

    game->render();
    EXPECT_EQ(game->getFrameCount(), 1u);
}

TEST_F(GameTest, LostSurfaceIsRecoverable) {
    auto game = startedGame();
    ctx.acquireScript = {SurfaceStatus::Lost};
    game->render();

    EXPECT_EQ(game->getState(), GameState::Running);
    EXPECT_EQ(ctx.configureCalls.size(), 2u);
    EXPECT_EQ(ctx.submitCount, 0);
}

TEST_F(GameTest, ReconfigureAtNewSizeRebuildsDepthTarget) {
    auto game = startedGame();
    window.framebuffer = WindowExtent{800, 600};
    ctx.acquireScript = {SurfaceStatus::Outdated};
    game->render();

    EXPECT_EQ(ctx.configureCalls.back().width, 800u);
    EXPECT_EQ(ctx.depthDestroyed, 1);
    ASSERT_EQ(ctx.depthCreated.size(), 2u);
    EXPECT_EQ(game->getDepthTarget().width, 800u);
    EXPECT_EQ(game->getDepthTarget().height, 600u);
    EXPECT_NEAR(game->getCamera().getAspect(), 800.0f / 600.0f, 1e-5f);
}

TEST_F(GameTest, FatalAcquireStopsTheLoop) {
    auto game = startedGame();
    ctx.acquireScript = {SurfaceStatus::Fatal};
    game->render();

    EXPECT_EQ(game->getState(), GameState::Stopped);
    EXPECT_TRUE(ctx.passes.empty());
    EXPECT_EQ(ctx.submitCount, 0);
    EXPECT_EQ(ctx.presentCount, 0);
    EXPECT_EQ(ctx.configureCalls.size(), 1u);

    game->render();
    EXPECT_EQ(ctx.acquireCount, 1);
}

TEST_F(GameTest, OutdatedPresentCountsTheFrameAndReconfigures) {
    auto game = startedGame();
    ctx.presentScript = {SurfaceStatus::Outdated};
    game->render();

    EXPECT_EQ(game->getState(), GameState::Running);
    EXPECT_EQ(game->getFrameCount(), 1u);
    EXPECT_EQ(ctx.configureCalls.size(), 2u);
}

TEST_F(GameTest, FatalPresentStops) {
    auto game = startedGame();
    ctx.presentScript = {SurfaceStatus::Fatal};
    game->render();

    EXPECT_EQ(game->getState(), GameState::Stopped);
    EXPECT_EQ(game->getFrameCount(), 1u);
}

TEST_F(GameTest, ResizeBeforeFirstFrameOnlyConfiguresSurface) {
    Game game(ctx, window, config);
    game.resize(800, 600);

    ASSERT_EQ(ctx.configureCalls.size(), 1u);
    EXPECT_EQ(ctx.configureCalls[0].width, 800u);
    EXPECT_TRUE(ctx.depthCreated.empty());
    EXPECT_EQ(game.getState(), GameState::Uninitialized);

    window.framebuffer = WindowExtent{800, 600};
    game.start(triangleMesh());
    EXPECT_EQ(game.getDepthTarget().width, 800u);
    game.render();
    EXPECT_EQ(game.getFrameCount(), 1u);
}

TEST_F(GameTest, ResizeWhileRunningRebuildsDepthTarget) {
    auto game = startedGame();
    game->resize(1600, 900);

    EXPECT_EQ(ctx.configureCalls.back().width, 1600u);
    EXPECT_EQ(ctx.depthDestroyed, 1);
    EXPECT_EQ(game->getDepthTarget().width, 1600u);
    EXPECT_NEAR(game->getCamera().getAspect(), 1600.0f / 900.0f, 1e-5f);
}

TEST_F(GameTest, MinimizedWindowSkipsFramesUntilRestored) {
    auto game = startedGame();
    game->onEvent(make_event<WindowResizeEvent>(0, 0));
    EXPECT_TRUE(game->isMinimized());

    game->render();
    EXPECT_EQ(ctx.acquireCount, 0);

    game->onEvent(make_event<WindowResizeEvent>(1024, 768));
    EXPECT_FALSE(game->isMinimized());
    EXPECT_EQ(game->getDepthTarget().width, 1024u);
    game->render();
    EXPECT_EQ(game->getFrameCount(), 1u);
}

TEST_F(GameTest, ResizeIsIgnoredOnceStopped) {
    auto game = startedGame();
    game->stop();
    size_t before = ctx.configureCalls.size();
    game->resize(640, 480);
    EXPECT_EQ(ctx.configureCalls.size(), before);
}

TEST_F(GameTest, NavigationIsScaledByElapsedTime) {
    auto game = startedGame();
    window.time = 10.0;
    game->render();
    EXPECT_FLOAT_EQ(game->getLastDeltaTime(), 0.0f);

    press(*game, InputAction::MoveForward);
    window.time = 12.0;
    game->render();

    EXPECT_FLOAT_EQ(game->getLastDeltaTime(), 2.0f);
    // 0.5 units/s for 2 s along -Z
    EXPECT_NEAR(game->getCamera().getPosition().z, 3.0f, 1e-4f);

    press(*game, InputAction::MoveForward, false);
    window.time = 13.0;
    game->render();
    EXPECT_NEAR(game->getCamera().getPosition().z, 3.0f, 1e-4f);
}

TEST_F(GameTest, OpposingKeysCancel) {
    auto game = startedGame();
    game->render();
    press(*game, InputAction::MoveLeft);
    press(*game, InputAction::MoveRight);
    press(*game, InputAction::MoveUp);
    window.time = 1.0;
    game->render();

    glm::vec3 pos = game->getCamera().getPosition();
    EXPECT_NEAR(pos.x, 0.0f, 1e-4f);
    EXPECT_NEAR(pos.y, 0.5f, 1e-4f);
}

TEST_F(GameTest, QuitActionStops) {
    auto game = startedGame();
    press(*game, InputAction::Quit);
    EXPECT_EQ(game->getState(), GameState::Stopped);
    game->render();
    EXPECT_EQ(ctx.acquireCount, 0);
}

TEST_F(GameTest, CloseWindowEventStops) {
    auto game = startedGame();
    game->onEvent(make_event<CloseWindowEvent>());
    EXPECT_FALSE(game->isRunning());
}

TEST_F(GameTest, LeftButtonControlsLookMode) {
    config.mouseSensitivity = 0.05f;
    auto game = startedGame();
    float yaw = game->getCamera().getYaw();
    float pitch = game->getCamera().getPitch();

    // ignored outside look mode
    game->onEvent(make_event<PointerMotionEvent>(10.0, 0.0));
    EXPECT_FLOAT_EQ(game->getCamera().getYaw(), yaw);

    game->onEvent(make_event<MouseButtonEvent>(MouseButtonEvent::LEFT, true));
    EXPECT_TRUE(game->isLooking());
    EXPECT_FALSE(window.cursorVisible);

    game->onEvent(make_event<PointerMotionEvent>(10.0, 4.0));
    EXPECT_NEAR(game->getCamera().getYaw(), yaw - 0.5f, 1e-5f);
    EXPECT_NEAR(game->getCamera().getPitch(), pitch - 0.2f, 1e-5f);

    game->onEvent(make_event<MouseButtonEvent>(MouseButtonEvent::LEFT, false));
    EXPECT_FALSE(game->isLooking());
    EXPECT_TRUE(window.cursorVisible);
}

TEST_F(GameTest, SensitivityIsRadiansPerPointerUnit) {
    ASSERT_FLOAT_EQ(config.mouseSensitivity, 0.1f);
    auto game = startedGame();
    float yaw = game->getCamera().getYaw();
    float pitch = game->getCamera().getPitch();

    game->onEvent(make_event<MouseButtonEvent>(MouseButtonEvent::LEFT, true));
    game->onEvent(make_event<PointerMotionEvent>(10.0, 0.0));
    EXPECT_NEAR(game->getCamera().getYaw(), yaw - 1.0f, 1e-5f);
    EXPECT_NEAR(game->getCamera().getPitch(), pitch, 1e-5f);

    game->onEvent(make_event<PointerMotionEvent>(0.0, -5.0));
    EXPECT_NEAR(game->getCamera().getPitch(), pitch + 0.5f, 1e-5f);
}

TEST_F(GameTest, OtherButtonsDoNotEnterLookMode) {
    auto game = startedGame();
    game->onEvent(make_event<MouseButtonEvent>(1, true));
    EXPECT_FALSE(game->isLooking());
}

TEST_F(GameTest, UiCapturingTheMouseBlocksLookMode) {
    UiCapturingGame game(ctx, window, config);
    game.start(triangleMesh());
    game.onEvent(make_event<MouseButtonEvent>(MouseButtonEvent::LEFT, true));
    EXPECT_FALSE(game.isLooking());
    EXPECT_TRUE(window.cursorVisible);

    game.captures = false;
    game.onEvent(make_event<MouseButtonEvent>(MouseButtonEvent::LEFT, true));
    EXPECT_TRUE(game.isLooking());
}

TEST_F(GameTest, StopRestoresCursor) {
    auto game = startedGame();
    game->onEvent(make_event<MouseButtonEvent>(MouseButtonEvent::LEFT, true));
    game->stop();
    EXPECT_TRUE(window.cursorVisible);
    EXPECT_FALSE(game->isLooking());
}

TEST_F(GameTest, DebugOverlayDrawsWorldAxes) {
    auto game = startedGame();
    press(*game, InputAction::ToggleDebugOverlay);
    press(*game, InputAction::ToggleDebugOverlay, false);
    EXPECT_TRUE(game->isDebugOverlayEnabled());

    game->render();
    const PassCommand* lines = drawWithInstances(ctx.lastPass(), 1);
    ASSERT_NE(lines, nullptr);
    EXPECT_EQ(lines->count, 6u);
    EXPECT_EQ(ctx.lastPass().draws().size(), 2u);

    // rebuilt each frame, not accumulated
    game->render();
    EXPECT_EQ(game->getDebugLines()->getIndices().size(), 6u);

    press(*game, InputAction::ToggleDebugOverlay);
    game->render();
    EXPECT_TRUE(game->getDebugLines()->getIndices().empty());
    EXPECT_EQ(drawWithInstances(ctx.lastPass(), 1), nullptr);
}

TEST_F(GameTest, FullscreenToggleUsesConfiguredMonitor) {
    config.monitor = "DP-2";
    auto game = startedGame();
    press(*game, InputAction::ToggleFullscreen);
    EXPECT_TRUE(window.fullscreen);
    EXPECT_EQ(window.requestedMonitor, std::optional<std::string>("DP-2"));

    press(*game, InputAction::ToggleFullscreen);
    EXPECT_FALSE(window.fullscreen);
}

TEST_F(GameTest, ExportConfigReflectsLiveState) {
    config.width = 1024;
    config.height = 768;
    auto game = startedGame();
    game->setMouseSensitivity(0.25f);

    GameConfig exported = game->exportConfig();
    EXPECT_FALSE(exported.fullscreen);
    EXPECT_FALSE(exported.monitor.has_value());
    EXPECT_EQ(exported.width, 1024u);
    EXPECT_EQ(exported.height, 768u);
    EXPECT_FLOAT_EQ(exported.mouseSensitivity, 0.25f);

    press(*game, InputAction::ToggleFullscreen);
    exported = game->exportConfig();
    EXPECT_TRUE(exported.fullscreen);
    EXPECT_EQ(exported.monitor, std::optional<std::string>("Primary"));
}

TEST_F(GameTest, DestructionWaitsForTheDevice) {
    startedGame().reset();
    EXPECT_GE(ctx.waitIdleCount, 1);
    EXPECT_EQ(ctx.depthDestroyed, 1);
    EXPECT_EQ(ctx.liveBufferCount(), 0u);
}
