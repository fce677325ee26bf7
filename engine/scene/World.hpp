#pragma once

#include <unordered_map>
#include <vector>

#include "engine/scene/Components.hpp"

namespace engine::scene
{
class World
{
public:
    Entity CreateEntity();
    void DestroyEntity(Entity entity);
    void Clear();

    [[nodiscard]] bool HasEntity(Entity entity) const;

    std::unordered_map<Entity, Transform>& Transforms() { return m_transforms; }
    std::unordered_map<Entity, AberrationComponent>& Aberrations() { return m_aberrations; }
    std::unordered_map<Entity, NameComponent>& Names() { return m_names; }

    [[nodiscard]] const std::unordered_map<Entity, Transform>& Transforms() const { return m_transforms; }
    [[nodiscard]] const std::unordered_map<Entity, AberrationComponent>& Aberrations() const { return m_aberrations; }
    [[nodiscard]] const std::unordered_map<Entity, NameComponent>& Names() const { return m_names; }

    [[nodiscard]] std::vector<Entity> Entities() const;

private:
    Entity m_nextEntity = 1;
    std::unordered_map<Entity, Transform> m_transforms;
    std::unordered_map<Entity, AberrationComponent> m_aberrations;
    std::unordered_map<Entity, NameComponent> m_names;
};
} // namespace engine::scene
