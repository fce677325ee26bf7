#include "game/dispel/DispelFeedback.hpp"

#include "game/dispel/SpatialProjector.hpp"

namespace game::dispel
{
namespace
{
constexpr float kStartMarkerScale = 0.02F;
constexpr float kCursorMarkerScale = 0.005F;
} // namespace

DispelFeedback BuildDispelFeedback(
    const GestureSession& session,
    const std::optional<glm::vec2>& pointer,
    const SpatialProjector& projector,
    const DispelTuning& tuning
)
{
    DispelFeedback feedback;
    if (!session.IsActive() || session.path.size() < 2U)
    {
        return feedback;
    }

    const float depth = tuning.gizmoDepth;
    feedback.strip.reserve(session.path.size());
    for (const glm::vec2& point : session.path)
    {
        if (const std::optional<glm::vec3> world = projector.ScreenToWorldPoint(point, depth); world.has_value())
        {
            feedback.strip.push_back(*world);
        }
    }
    if (feedback.strip.size() < 2U)
    {
        feedback.strip.clear();
    }

    if (const std::optional<glm::vec3> start = projector.ScreenToWorldPoint(session.path.front(), depth); start.has_value())
    {
        feedback.startMarker = DispelMarker{*start, depth * kStartMarkerScale};
    }

    if (pointer.has_value())
    {
        if (const std::optional<glm::vec3> cursor = projector.ScreenToWorldPoint(*pointer, depth); cursor.has_value())
        {
            feedback.cursorMarker = DispelMarker{*cursor, depth * kCursorMarkerScale};
        }
    }
    return feedback;
}
} // namespace game::dispel
