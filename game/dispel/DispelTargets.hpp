#pragma once

#include <vector>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include "engine/scene/World.hpp"

namespace game::dispel
{
class SpatialProjector;

struct DispelTarget
{
    engine::scene::Entity entity = 0;
    glm::vec3 worldPosition{0.0F};
};

/// Live aberrations with a transform, ordered by entity id.
[[nodiscard]] std::vector<DispelTarget> CollectDispelTargets(const engine::scene::World& world);

/// Targets whose screen projection lies inside the closed path. Targets that
/// cannot be projected are skipped.
[[nodiscard]] std::vector<engine::scene::Entity> FindEnclosedTargets(
    const std::vector<glm::vec2>& closedPath,
    const std::vector<DispelTarget>& targets,
    const SpatialProjector& projector
);
} // namespace game::dispel
