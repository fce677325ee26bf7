#pragma once

#include <cstdint>
#include <string>

#include <glm/vec3.hpp>

namespace engine::scene
{
using Entity = std::uint32_t;

struct Transform
{
    glm::vec3 position{0.0F, 0.0F, 0.0F};
    glm::vec3 rotationEuler{0.0F, 0.0F, 0.0F};
    glm::vec3 scale{1.0F, 1.0F, 1.0F};
};

// Marks an entity as a dispel target.
struct AberrationComponent
{
    float size = 2.0F;
    bool npc = false;
};

struct NameComponent
{
    std::string name;
};
} // namespace engine::scene
