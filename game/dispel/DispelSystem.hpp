#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <glm/vec2.hpp>

#include "engine/scene/Components.hpp"
#include "game/dispel/DispelFeedback.hpp"
#include "game/dispel/DispelTargets.hpp"
#include "game/dispel/DispelTuning.hpp"
#include "game/dispel/GestureSession.hpp"

namespace game::dispel
{
class SpatialProjector;

// Pointer input for one frame. The position is empty while the cursor is outside the window.
struct PointerState
{
    std::optional<glm::vec2> position;
    bool primaryPressed = false;
    bool primaryHeld = false;
    bool primaryReleased = false;
    bool secondaryPressed = false;
};

enum class HostCursorMode
{
    Captured,
    Free
};

struct DispelFrameResult
{
    std::optional<HostCursorMode> cursorRequest;
    std::vector<engine::scene::Entity> removals;
    bool closed = false;
    std::size_t closedPathPoints = 0;
};

// Frame steps, run in this order by DispelSystem::Update.
void ToggleDispel(GestureSession& session, const PointerState& pointer, const DispelTuning& tuning, DispelFrameResult& result);
void SampleStroke(GestureSession& session, const PointerState& pointer, float deltaSeconds, const DispelTuning& tuning);
void CheckClosureAndDispel(
    GestureSession& session,
    const PointerState& pointer,
    const DispelTuning& tuning,
    const SpatialProjector& projector,
    const std::vector<DispelTarget>& targets,
    DispelFrameResult& result
);
void ExitDispelOnCancel(GestureSession& session, const PointerState& pointer, DispelFrameResult& result);

void DeactivateDispel(GestureSession& session, DispelFrameResult& result);
[[nodiscard]] bool IsLoopClosed(const GestureSession& session, const glm::vec2& pointer, const DispelTuning& tuning);

class DispelSystem
{
public:
    void Initialize(const DispelTuning& tuning);
    void ApplyTuning(const DispelTuning& tuning);

    DispelFrameResult Update(
        float deltaSeconds,
        const PointerState& pointer,
        const SpatialProjector& projector,
        const std::vector<DispelTarget>& targets
    );

    /// Scene teardown. Returns the cursor mode to restore if the mechanic had freed it.
    [[nodiscard]] std::optional<HostCursorMode> Teardown();

    [[nodiscard]] bool IsActive() const { return m_session.IsActive(); }
    [[nodiscard]] DispelMode Mode() const { return m_session.mode; }
    [[nodiscard]] const std::vector<glm::vec2>& Path() const { return m_session.path; }
    [[nodiscard]] const GestureSession& Session() const { return m_session; }
    [[nodiscard]] const DispelTuning& Tuning() const { return m_tuning; }
    [[nodiscard]] const DispelFeedback& Feedback() const { return m_feedback; }
    [[nodiscard]] int LastDispelCount() const { return m_lastDispelCount; }
    [[nodiscard]] int TotalDispelled() const { return m_totalDispelled; }

private:
    GestureSession m_session{};
    DispelTuning m_tuning{};
    DispelFeedback m_feedback{};
    int m_lastDispelCount = 0;
    int m_totalDispelled = 0;
};
} // namespace game::dispel
