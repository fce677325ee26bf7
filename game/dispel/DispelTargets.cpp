#include "game/dispel/DispelTargets.hpp"

#include <algorithm>
#include <optional>

#include "game/dispel/Polygon2D.hpp"
#include "game/dispel/SpatialProjector.hpp"

namespace game::dispel
{
std::vector<DispelTarget> CollectDispelTargets(const engine::scene::World& world)
{
    std::vector<DispelTarget> targets;
    targets.reserve(world.Aberrations().size());
    for (const auto& [entity, aberration] : world.Aberrations())
    {
        (void)aberration;
        const auto transformIt = world.Transforms().find(entity);
        if (transformIt == world.Transforms().end())
        {
            continue;
        }
        targets.push_back(DispelTarget{entity, transformIt->second.position});
    }

    std::sort(targets.begin(), targets.end(), [](const DispelTarget& a, const DispelTarget& b) {
        return a.entity < b.entity;
    });
    return targets;
}

std::vector<engine::scene::Entity> FindEnclosedTargets(
    const std::vector<glm::vec2>& closedPath,
    const std::vector<DispelTarget>& targets,
    const SpatialProjector& projector
)
{
    std::vector<engine::scene::Entity> enclosed;
    if (closedPath.size() < 3U)
    {
        return enclosed;
    }

    for (const DispelTarget& target : targets)
    {
        const std::optional<glm::vec2> screen = projector.WorldToScreen(target.worldPosition);
        if (screen.has_value() && PointInPolygon2D(closedPath, *screen))
        {
            enclosed.push_back(target.entity);
        }
    }
    return enclosed;
}
} // namespace game::dispel
