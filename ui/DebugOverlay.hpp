#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <glm/vec2.hpp>

namespace engine::platform
{
class Window;
}

namespace ui
{
struct DebugOverlayContext
{
    std::string modeName;
    const std::vector<glm::vec2>* path = nullptr;
    std::optional<glm::vec2> pointer;
    float closureDistance = 0.0F;
    int minPoints = 0;
    int lastDispelCount = 0;
    int totalDispelled = 0;
    std::size_t liveTargets = 0;
    int canvasWidth = 0;
    int canvasHeight = 0;
    float canvasScale = 1.0F;
    bool paused = false;
};

class DebugOverlay
{
public:
    bool Initialize(engine::platform::Window& window);
    void Shutdown();

    void BeginFrame();
    void Render(const DebugOverlayContext& context, float fps);

    void Toggle() { m_visible = !m_visible; }
    [[nodiscard]] bool IsVisible() const { return m_visible; }
    [[nodiscard]] bool WantsMouseCapture() const;

private:
    bool m_initialized = false;
    bool m_visible = true;
};
} // namespace ui
