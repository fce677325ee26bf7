#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <glm/vec3.hpp>

#include "engine/scene/World.hpp"

namespace game::maps
{
struct TargetPlacement
{
    std::string name = "aberration";
    glm::vec3 position{0.0F};
    float size = 2.0F;
    bool npc = false;
};

// Static list of dispel targets placed when the scene starts.
struct ScenePlacement
{
    int assetVersion = 1;
    std::vector<TargetPlacement> targets;
};

[[nodiscard]] ScenePlacement DefaultScenePlacement();

[[nodiscard]] bool LoadScenePlacement(const std::string& path, ScenePlacement& outPlacement, std::string* outError = nullptr);
[[nodiscard]] bool SaveScenePlacement(const std::string& path, const ScenePlacement& placement, std::string* outError = nullptr);

// Returns the number of entities created.
std::size_t SpawnScenePlacement(const ScenePlacement& placement, engine::scene::World& world);
} // namespace game::maps
