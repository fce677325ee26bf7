#include "game/dispel/DispelSystem.hpp"

#include <iostream>

#include <glm/geometric.hpp>

#include "game/dispel/SpatialProjector.hpp"

namespace game::dispel
{
namespace
{
void BeginStroke(GestureSession& session, const PointerState& pointer, const DispelTuning& tuning)
{
    session.path.clear();
    session.sampleTimer.SetInterval(tuning.segmentIntervalSeconds);
    session.sampleTimer.Reset();
    if (pointer.position.has_value())
    {
        session.path.push_back(*pointer.position);
    }
}
} // namespace

void ToggleDispel(GestureSession& session, const PointerState& pointer, const DispelTuning& tuning, DispelFrameResult& result)
{
    if (!pointer.primaryPressed)
    {
        return;
    }

    switch (session.mode)
    {
        case DispelMode::Dormant:
            session.mode = DispelMode::Armed;
            session.path.clear();
            result.cursorRequest = HostCursorMode::Free;
            std::cout << "[Dispel] Armed\n";
            break;
        case DispelMode::Armed:
            session.mode = DispelMode::Drawing;
            BeginStroke(session, pointer, tuning);
            std::cout << "[Dispel] Drawing\n";
            break;
        case DispelMode::Drawing:
            // A press after a release starts a fresh stroke.
            BeginStroke(session, pointer, tuning);
            break;
    }
}

void SampleStroke(GestureSession& session, const PointerState& pointer, float deltaSeconds, const DispelTuning& tuning)
{
    if (!session.IsDrawing())
    {
        return;
    }

    if (pointer.primaryReleased)
    {
        session.path.clear();
        return;
    }

    if (!pointer.primaryHeld)
    {
        return;
    }

    session.sampleTimer.Tick(deltaSeconds);
    if (!session.sampleTimer.JustFinished() || !pointer.position.has_value())
    {
        return;
    }

    const glm::vec2 position = *pointer.position;
    if (!session.path.empty() && glm::distance(position, session.path.back()) <= tuning.minPointDistance)
    {
        return;
    }
    session.path.push_back(position);
}

bool IsLoopClosed(const GestureSession& session, const glm::vec2& pointer, const DispelTuning& tuning)
{
    if (!session.IsDrawing() || session.path.size() < static_cast<std::size_t>(tuning.minPoints))
    {
        return false;
    }
    return glm::distance(pointer, session.path.front()) <= tuning.closureDistance;
}

void CheckClosureAndDispel(
    GestureSession& session,
    const PointerState& pointer,
    const DispelTuning& tuning,
    const SpatialProjector& projector,
    const std::vector<DispelTarget>& targets,
    DispelFrameResult& result
)
{
    // Cancel on the same frame takes priority over closing the loop.
    if (pointer.secondaryPressed || !pointer.position.has_value())
    {
        return;
    }
    if (!IsLoopClosed(session, *pointer.position, tuning))
    {
        return;
    }

    session.path.push_back(*pointer.position);
    result.closed = true;
    result.closedPathPoints = session.path.size();
    result.removals = FindEnclosedTargets(session.path, targets, projector);

    std::cout << "[Dispel] Closed loop with " << session.path.size() << " points, dispelled "
              << result.removals.size() << " target(s)\n";

    DeactivateDispel(session, result);
}

void ExitDispelOnCancel(GestureSession& session, const PointerState& pointer, DispelFrameResult& result)
{
    if (!session.IsActive() || !pointer.secondaryPressed)
    {
        return;
    }

    std::cout << "[Dispel] Cancelled while " << DispelModeName(session.mode) << "\n";
    DeactivateDispel(session, result);
}

void DeactivateDispel(GestureSession& session, DispelFrameResult& result)
{
    session.mode = DispelMode::Dormant;
    session.path.clear();
    session.sampleTimer.Reset();
    result.cursorRequest = HostCursorMode::Captured;
}

void DispelSystem::Initialize(const DispelTuning& tuning)
{
    ApplyTuning(tuning);
    m_session = GestureSession{};
    m_session.sampleTimer.SetInterval(m_tuning.segmentIntervalSeconds);
    m_feedback = DispelFeedback{};
    m_lastDispelCount = 0;
    m_totalDispelled = 0;
}

void DispelSystem::ApplyTuning(const DispelTuning& tuning)
{
    m_tuning = tuning;
    SanitizeDispelTuning(m_tuning);
}

DispelFrameResult DispelSystem::Update(
    float deltaSeconds,
    const PointerState& pointer,
    const SpatialProjector& projector,
    const std::vector<DispelTarget>& targets
)
{
    DispelFrameResult result;

    ToggleDispel(m_session, pointer, m_tuning, result);
    SampleStroke(m_session, pointer, deltaSeconds, m_tuning);
    CheckClosureAndDispel(m_session, pointer, m_tuning, projector, targets, result);
    ExitDispelOnCancel(m_session, pointer, result);
    m_feedback = BuildDispelFeedback(m_session, pointer.position, projector, m_tuning);

    if (result.closed)
    {
        m_lastDispelCount = static_cast<int>(result.removals.size());
        m_totalDispelled += m_lastDispelCount;
    }
    return result;
}

std::optional<HostCursorMode> DispelSystem::Teardown()
{
    const bool wasActive = m_session.IsActive();
    m_session = GestureSession{};
    m_feedback = DispelFeedback{};
    if (!wasActive)
    {
        return std::nullopt;
    }
    return HostCursorMode::Captured;
}
} // namespace game::dispel
