#pragma once

#include <optional>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include "engine/render/Camera.hpp"

namespace game::dispel
{
// Converts between window (input) pixels and the camera's canvas viewport.
// The canvas scale is applied here and nowhere else:
//   viewport = screen / canvasScale, screen = viewport * canvasScale.
class SpatialProjector
{
public:
    SpatialProjector(const engine::render::Camera& camera, float canvasScale);

    [[nodiscard]] std::optional<glm::vec2> WorldToScreen(const glm::vec3& world) const;
    [[nodiscard]] std::optional<engine::render::Ray> ScreenToWorldRay(const glm::vec2& screen) const;
    [[nodiscard]] std::optional<glm::vec3> ScreenToWorldPoint(const glm::vec2& screen, float depth) const;

    [[nodiscard]] float CanvasScale() const { return m_canvasScale; }
    [[nodiscard]] const engine::render::Camera& GetCamera() const { return m_camera; }

private:
    const engine::render::Camera& m_camera;
    float m_canvasScale;
};
} // namespace game::dispel
