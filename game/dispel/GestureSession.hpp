#pragma once

#include <vector>

#include <glm/vec2.hpp>

#include "engine/core/Time.hpp"

namespace game::dispel
{
enum class DispelMode
{
    Dormant,
    Armed,
    Drawing
};

// The one live gesture. The path is only populated while Drawing; its
// insertion order is the polygon winding.
struct GestureSession
{
    DispelMode mode = DispelMode::Dormant;
    std::vector<glm::vec2> path;
    engine::core::RepeatingTimer sampleTimer{0.05F};

    [[nodiscard]] bool IsActive() const { return mode != DispelMode::Dormant; }
    [[nodiscard]] bool IsDrawing() const { return mode == DispelMode::Drawing; }
};

inline const char* DispelModeName(DispelMode mode)
{
    switch (mode)
    {
        case DispelMode::Armed: return "Armed";
        case DispelMode::Drawing: return "Drawing";
        case DispelMode::Dormant:
        default: return "Dormant";
    }
}
} // namespace game::dispel
