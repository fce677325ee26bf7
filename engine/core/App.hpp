#pragma once

#include <string>
#include <vector>

#include "engine/core/Time.hpp"
#include "engine/platform/ActionBindings.hpp"
#include "engine/platform/Input.hpp"
#include "engine/platform/Window.hpp"
#include "engine/render/Camera.hpp"
#include "engine/render/CanvasTarget.hpp"
#include "engine/render/Renderer.hpp"
#include "engine/scene/World.hpp"
#include "game/dispel/DispelSystem.hpp"
#include "game/dispel/DispelTuning.hpp"
#include "game/maps/ScenePlacement.hpp"
#include "ui/DebugOverlay.hpp"

namespace engine::core
{
class App
{
public:
    bool Run();

    struct GraphicsSettings
    {
        int assetVersion = 1;
        int width = 1280;
        int height = 720;
        bool vsync = true;
        bool fullscreen = false;
    };

private:
    bool Initialize();
    void Shutdown();

    void UpdatePause();
    void SetPaused(bool paused);
    void UpdateDispel(float deltaSeconds);
    void ApplyDispelResult(const game::dispel::DispelFrameResult& result);
    void ApplyCursorMode(game::dispel::HostCursorMode mode);
    void SyncCameraViewport();
    void RenderFrame(float fps);
    void DrawScene();
    void DrawDispelFeedback();

    [[nodiscard]] game::dispel::PointerState BuildPointerState() const;

    bool LoadControlsConfig();
    bool SaveControlsConfig() const;
    bool LoadGraphicsConfig();
    bool SaveGraphicsConfig() const;
    bool LoadDispelConfig();
    bool LoadSceneConfig();

    platform::Window m_window;
    platform::WindowSettings m_windowSettings;
    platform::Input m_input;
    platform::ActionBindings m_actionBindings;
    Time m_time;

    render::Renderer m_renderer;
    render::CanvasTarget m_canvas;
    render::Camera m_camera;

    scene::World m_world;
    game::dispel::DispelSystem m_dispel;
    game::dispel::DispelTuning m_dispelTuning;
    game::maps::ScenePlacement m_scenePlacement;

    ui::DebugOverlay m_debugOverlay;

    GraphicsSettings m_graphicsSettings;
    // Cursor mode the game wants once unpaused.
    game::dispel::HostCursorMode m_desiredCursorMode = game::dispel::HostCursorMode::Captured;
    bool m_paused = false;
};
} // namespace engine::core
