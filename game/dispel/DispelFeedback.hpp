#pragma once

#include <optional>
#include <vector>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include "game/dispel/DispelTuning.hpp"
#include "game/dispel/GestureSession.hpp"

namespace game::dispel
{
class SpatialProjector;

struct DispelMarker
{
    glm::vec3 center{0.0F};
    float radius = 0.0F;
};

// World-space data for drawing the gesture just in front of the camera.
struct DispelFeedback
{
    std::vector<glm::vec3> strip;
    std::optional<DispelMarker> startMarker;
    std::optional<DispelMarker> cursorMarker;

    [[nodiscard]] bool Empty() const { return strip.empty() && !startMarker.has_value() && !cursorMarker.has_value(); }
};

[[nodiscard]] DispelFeedback BuildDispelFeedback(
    const GestureSession& session,
    const std::optional<glm::vec2>& pointer,
    const SpatialProjector& projector,
    const DispelTuning& tuning
);
} // namespace game::dispel
