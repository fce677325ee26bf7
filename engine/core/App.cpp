#include "engine/core/App.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>

#include <glad/glad.h>
#include <GLFW/glfw3.h>
#include <glm/common.hpp>
#include <glm/vec3.hpp>
#include <nlohmann/json.hpp>

#include "game/dispel/DispelTargets.hpp"
#include "game/dispel/SpatialProjector.hpp"

namespace engine::core
{
namespace
{
using json = nlohmann::json;

constexpr const char* kControlsConfigPath = "config/controls.json";
constexpr const char* kGraphicsConfigPath = "config/graphics.json";
constexpr const char* kDispelConfigPath = "config/dispel.json";
constexpr const char* kSceneConfigPath = "config/scene.json";

const glm::vec3 kClearColor{0.06F, 0.05F, 0.09F};
const glm::vec3 kGridMajorColor{0.28F, 0.26F, 0.34F};
const glm::vec3 kGridMinorColor{0.15F, 0.14F, 0.19F};
const glm::vec3 kAberrationColor{0.85F, 0.25F, 0.55F};
const glm::vec3 kNpcColor{0.35F, 0.75F, 0.55F};
const glm::vec3 kStripColor{1.0F, 0.82F, 0.45F};
const glm::vec3 kStartMarkerColor{0.55F, 0.8F, 1.0F};
const glm::vec3 kCursorMarkerColor{1.0F, 1.0F, 1.0F};
} // namespace

bool App::Run()
{
    std::cout << "Aberrant - dispel prototype\n";

    if (!Initialize())
    {
        Shutdown();
        return false;
    }

    float currentFps = 0.0F;
    double fpsAccumulator = 0.0;
    int fpsFrames = 0;

    while (!m_window.ShouldClose())
    {
        m_window.PollEvents();
        m_input.Update(m_window.NativeHandle());
        m_time.BeginFrame(glfwGetTime());

        const float deltaSeconds = static_cast<float>(m_time.DeltaSeconds());
        fpsAccumulator += m_time.DeltaSeconds();
        ++fpsFrames;
        if (fpsAccumulator >= 0.5)
        {
            currentFps = static_cast<float>(static_cast<double>(fpsFrames) / fpsAccumulator);
            fpsAccumulator = 0.0;
            fpsFrames = 0;
        }

        if (m_actionBindings.IsPressed(m_input, platform::InputAction::ToggleDebugHud))
        {
            m_debugOverlay.Toggle();
        }

        UpdatePause();
        SyncCameraViewport();

        if (!m_paused)
        {
            if (m_window.IsCursorCaptured())
            {
                m_camera.ApplyLook(m_input.MouseDelta(), m_actionBindings.MouseSensitivity());
            }
            UpdateDispel(deltaSeconds);
        }

        RenderFrame(currentFps);
        m_window.SwapBuffers();
    }

    Shutdown();
    return true;
}

bool App::Initialize()
{
    (void)LoadControlsConfig();
    (void)LoadGraphicsConfig();
    (void)LoadDispelConfig();
    (void)LoadSceneConfig();

    m_windowSettings.width = m_graphicsSettings.width;
    m_windowSettings.height = m_graphicsSettings.height;
    m_windowSettings.vsync = m_graphicsSettings.vsync;
    m_windowSettings.fullscreen = m_graphicsSettings.fullscreen;
    m_windowSettings.title = "Aberrant";

    if (!m_window.Initialize(m_windowSettings))
    {
        return false;
    }

    if (!gladLoadGL(reinterpret_cast<GLADloadfunc>(glfwGetProcAddress)))
    {
        std::cerr << "Failed to initialize GLAD.\n";
        return false;
    }

    const unsigned char* glVersion = glGetString(GL_VERSION);
    std::cout << "OpenGL version: " << (glVersion != nullptr ? reinterpret_cast<const char*>(glVersion) : "unknown") << "\n";

    if (!m_renderer.Initialize())
    {
        std::cerr << "Failed to initialize renderer.\n";
        return false;
    }

    if (!m_canvas.Create(m_window.FramebufferWidth(), m_window.FramebufferHeight(), m_dispelTuning.canvasScale))
    {
        std::cerr << "Warning: canvas target unavailable, rendering at full resolution.\n";
    }

    if (!m_debugOverlay.Initialize(m_window))
    {
        std::cerr << "Warning: debug overlay unavailable.\n";
    }

    m_window.SetResizeCallback([this](int width, int height) {
        if (width > 0 && height > 0 && !m_canvas.Resize(width, height, m_dispelTuning.canvasScale))
        {
            std::cerr << "[Canvas] Resize to " << width << "x" << height << " failed.\n";
        }
    });
    m_window.SetFocusCallback([this](bool focused) {
        // Losing focus pauses the game, except while a gesture is in progress.
        if (!focused && !m_paused && !m_dispel.IsActive())
        {
            SetPaused(true);
        }
    });

    m_dispel.Initialize(m_dispelTuning);
    const std::size_t spawned = game::maps::SpawnScenePlacement(m_scenePlacement, m_world);
    std::cout << "[Scene] Placed " << spawned << " target(s)\n";

    ApplyCursorMode(game::dispel::HostCursorMode::Captured);
    SyncCameraViewport();
    return true;
}

void App::Shutdown()
{
    if (const std::optional<game::dispel::HostCursorMode> restore = m_dispel.Teardown(); restore.has_value())
    {
        ApplyCursorMode(*restore);
    }
    m_world.Clear();

    m_debugOverlay.Shutdown();
    m_canvas.Destroy();
    m_renderer.Shutdown();
    m_window.Shutdown();
}

void App::UpdatePause()
{
    if (m_actionBindings.IsPressed(m_input, platform::InputAction::Pause))
    {
        SetPaused(!m_paused);
    }
}

void App::SetPaused(bool paused)
{
    if (m_paused == paused)
    {
        return;
    }

    m_paused = paused;
    std::cout << (paused ? "[Pause] Paused\n" : "[Pause] Resumed\n");
    if (paused)
    {
        m_window.SetCursorCaptured(false);
        m_window.SetCursorShape(platform::CursorShape::Arrow);
    }
    else
    {
        ApplyCursorMode(m_desiredCursorMode);
    }
    m_input.DiscardMouseDelta();
}

void App::ApplyCursorMode(game::dispel::HostCursorMode mode)
{
    m_desiredCursorMode = mode;
    if (m_paused)
    {
        return;
    }

    const bool captured = mode == game::dispel::HostCursorMode::Captured;
    if (captured != m_window.IsCursorCaptured())
    {
        m_input.DiscardMouseDelta();
    }
    m_window.SetCursorCaptured(captured);
    m_window.SetCursorShape(captured ? platform::CursorShape::Arrow : platform::CursorShape::Crosshair);
}

void App::SyncCameraViewport()
{
    const float scale = m_dispelTuning.canvasScale;
    const glm::vec2 windowSize{
        static_cast<float>(std::max(1, m_window.WindowWidth())),
        static_cast<float>(std::max(1, m_window.WindowHeight())),
    };
    // Input arrives in window pixels, the camera works in canvas pixels.
    m_camera.SetViewportSize(windowSize / scale);
}

game::dispel::PointerState App::BuildPointerState() const
{
    game::dispel::PointerState pointer;
    pointer.position = m_input.CursorPosition();
    // A captured cursor has no on-screen position, so the HUD cannot be under it.
    if (!m_window.IsCursorCaptured() && m_debugOverlay.WantsMouseCapture())
    {
        return pointer;
    }

    pointer.primaryPressed = m_actionBindings.IsPressed(m_input, platform::InputAction::DispelDraw);
    pointer.primaryHeld = m_actionBindings.IsDown(m_input, platform::InputAction::DispelDraw);
    pointer.primaryReleased = m_actionBindings.IsReleased(m_input, platform::InputAction::DispelDraw);
    pointer.secondaryPressed = m_actionBindings.IsPressed(m_input, platform::InputAction::DispelCancel);
    return pointer;
}

void App::UpdateDispel(float deltaSeconds)
{
    const game::dispel::PointerState pointer = BuildPointerState();
    const game::dispel::SpatialProjector projector(m_camera, m_dispelTuning.canvasScale);
    const std::vector<game::dispel::DispelTarget> targets = game::dispel::CollectDispelTargets(m_world);

    const game::dispel::DispelFrameResult result = m_dispel.Update(deltaSeconds, pointer, projector, targets);
    ApplyDispelResult(result);
}

void App::ApplyDispelResult(const game::dispel::DispelFrameResult& result)
{
    for (const scene::Entity entity : result.removals)
    {
        const auto nameIt = m_world.Names().find(entity);
        std::cout << "[Dispel] Removed " << (nameIt != m_world.Names().end() ? nameIt->second.name : std::string{"entity"})
                  << " (" << entity << ")\n";
        m_world.DestroyEntity(entity);
    }

    if (result.cursorRequest.has_value())
    {
        ApplyCursorMode(*result.cursorRequest);
    }
}

void App::RenderFrame(float fps)
{
    const int fbWidth = m_window.FramebufferWidth();
    const int fbHeight = m_window.FramebufferHeight();
    const bool useCanvas = m_canvas.IsValid();

    if (useCanvas)
    {
        m_canvas.Bind();
    }
    else
    {
        m_renderer.SetViewport(fbWidth, fbHeight);
    }

    m_renderer.BeginFrame(kClearColor);
    DrawScene();
    DrawDispelFeedback();
    m_renderer.EndFrame(m_camera.ViewProjection());

    if (useCanvas)
    {
        m_canvas.Unbind();
        m_renderer.SetViewport(fbWidth, fbHeight);
        m_canvas.BlitToScreen(fbWidth, fbHeight);
    }

    ui::DebugOverlayContext context;
    context.modeName = game::dispel::DispelModeName(m_dispel.Mode());
    context.path = &m_dispel.Path();
    context.pointer = m_input.CursorPosition();
    context.closureDistance = m_dispel.Tuning().closureDistance;
    context.minPoints = m_dispel.Tuning().minPoints;
    context.lastDispelCount = m_dispel.LastDispelCount();
    context.totalDispelled = m_dispel.TotalDispelled();
    context.liveTargets = m_world.Aberrations().size();
    context.canvasWidth = m_canvas.Width();
    context.canvasHeight = m_canvas.Height();
    context.canvasScale = m_dispelTuning.canvasScale;
    context.paused = m_paused;

    m_debugOverlay.BeginFrame();
    m_debugOverlay.Render(context, fps);
}

void App::DrawScene()
{
    m_renderer.DrawGrid(30, 1.0F, kGridMajorColor, kGridMinorColor);

    for (const auto& [entity, aberration] : m_world.Aberrations())
    {
        const auto transformIt = m_world.Transforms().find(entity);
        if (transformIt == m_world.Transforms().end())
        {
            continue;
        }
        const glm::vec3& center = transformIt->second.position;
        const float half = aberration.size * 0.5F;
        const glm::vec3 color = aberration.npc ? kNpcColor : kAberrationColor;
        m_renderer.DrawWireBox(center, glm::vec3{half * 0.6F, half, half * 0.6F}, color);
        m_renderer.DrawCircle(glm::vec3{center.x, 0.01F, center.z}, half, 20, color);
    }
}

void App::DrawDispelFeedback()
{
    const game::dispel::DispelFeedback& feedback = m_dispel.Feedback();
    if (feedback.Empty())
    {
        return;
    }

    for (std::size_t i = 1; i < feedback.strip.size(); ++i)
    {
        m_renderer.DrawOverlayLine(feedback.strip[i - 1U], feedback.strip[i], kStripColor);
    }
    if (feedback.startMarker.has_value())
    {
        m_renderer.DrawWireSphere(feedback.startMarker->center, feedback.startMarker->radius, 16, kStartMarkerColor, true);
    }
    if (feedback.cursorMarker.has_value())
    {
        m_renderer.DrawWireSphere(feedback.cursorMarker->center, feedback.cursorMarker->radius, 12, kCursorMarkerColor, true);
    }
}

bool App::LoadControlsConfig()
{
    m_actionBindings.ResetDefaults();

    if (!std::filesystem::exists(kControlsConfigPath))
    {
        return SaveControlsConfig();
    }

    std::string error;
    if (!m_actionBindings.LoadFromJsonFile(kControlsConfigPath, &error))
    {
        std::cerr << "[Config] " << error << ". Using default controls.\n";
        m_actionBindings.ResetDefaults();
        return SaveControlsConfig();
    }
    return true;
}

bool App::SaveControlsConfig() const
{
    std::string error;
    if (!m_actionBindings.SaveToJsonFile(kControlsConfigPath, &error))
    {
        std::cerr << "[Config] " << error << "\n";
        return false;
    }
    return true;
}

bool App::LoadGraphicsConfig()
{
    m_graphicsSettings = GraphicsSettings{};

    std::filesystem::create_directories("config");
    const std::filesystem::path path(kGraphicsConfigPath);
    if (!std::filesystem::exists(path))
    {
        return SaveGraphicsConfig();
    }

    std::ifstream stream(path);
    if (!stream.is_open())
    {
        std::cerr << "[Config] Failed to open graphics config.\n";
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception&)
    {
        std::cerr << "[Config] Invalid graphics JSON. Using defaults.\n";
        return SaveGraphicsConfig();
    }

    if (root.contains("width") && root["width"].is_number_integer())
    {
        m_graphicsSettings.width = root["width"].get<int>();
    }
    if (root.contains("height") && root["height"].is_number_integer())
    {
        m_graphicsSettings.height = root["height"].get<int>();
    }
    if (root.contains("vsync") && root["vsync"].is_boolean())
    {
        m_graphicsSettings.vsync = root["vsync"].get<bool>();
    }
    if (root.contains("fullscreen") && root["fullscreen"].is_boolean())
    {
        m_graphicsSettings.fullscreen = root["fullscreen"].get<bool>();
    }

    m_graphicsSettings.width = std::max(640, m_graphicsSettings.width);
    m_graphicsSettings.height = std::max(360, m_graphicsSettings.height);
    return true;
}

bool App::SaveGraphicsConfig() const
{
    std::filesystem::create_directories("config");

    json root;
    root["asset_version"] = m_graphicsSettings.assetVersion;
    root["width"] = m_graphicsSettings.width;
    root["height"] = m_graphicsSettings.height;
    root["vsync"] = m_graphicsSettings.vsync;
    root["fullscreen"] = m_graphicsSettings.fullscreen;

    std::ofstream stream(kGraphicsConfigPath);
    if (!stream.is_open())
    {
        return false;
    }
    stream << root.dump(2) << "\n";
    return true;
}

bool App::LoadDispelConfig()
{
    std::string error;
    if (!game::dispel::LoadDispelTuning(kDispelConfigPath, m_dispelTuning, &error))
    {
        std::cerr << "[Config] " << error << ". Using default dispel tuning.\n";
        return false;
    }
    std::cout << "[Config] Dispel: interval=" << m_dispelTuning.segmentIntervalSeconds
              << "s closure=" << m_dispelTuning.closureDistance
              << "px min_points=" << m_dispelTuning.minPoints
              << " canvas_scale=" << m_dispelTuning.canvasScale << "\n";
    return true;
}

bool App::LoadSceneConfig()
{
    std::string error;
    if (!game::maps::LoadScenePlacement(kSceneConfigPath, m_scenePlacement, &error))
    {
        std::cerr << "[Config] " << error << ". Using default scene.\n";
        m_scenePlacement = game::maps::DefaultScenePlacement();
        return false;
    }
    return true;
}
} // namespace engine::core
