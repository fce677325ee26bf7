#include "game/dispel/SpatialProjector.hpp"

#include <algorithm>

namespace game::dispel
{
SpatialProjector::SpatialProjector(const engine::render::Camera& camera, float canvasScale)
    : m_camera(camera)
    , m_canvasScale(std::max(1.0e-3F, canvasScale))
{
}

std::optional<glm::vec2> SpatialProjector::WorldToScreen(const glm::vec3& world) const
{
    const std::optional<glm::vec2> viewport = m_camera.WorldToViewport(world);
    if (!viewport.has_value())
    {
        return std::nullopt;
    }
    return *viewport * m_canvasScale;
}

std::optional<engine::render::Ray> SpatialProjector::ScreenToWorldRay(const glm::vec2& screen) const
{
    return m_camera.ViewportToWorld(screen / m_canvasScale);
}

std::optional<glm::vec3> SpatialProjector::ScreenToWorldPoint(const glm::vec2& screen, float depth) const
{
    const std::optional<engine::render::Ray> ray = ScreenToWorldRay(screen);
    if (!ray.has_value())
    {
        return std::nullopt;
    }
    return ray->PointAt(depth);
}
} // namespace game::dispel
