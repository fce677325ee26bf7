#include "engine/scene/World.hpp"

#include <algorithm>
#include <unordered_set>

namespace engine::scene
{
Entity World::CreateEntity()
{
    return m_nextEntity++;
}

void World::DestroyEntity(Entity entity)
{
    m_transforms.erase(entity);
    m_aberrations.erase(entity);
    m_names.erase(entity);
}

void World::Clear()
{
    m_nextEntity = 1;
    m_transforms.clear();
    m_aberrations.clear();
    m_names.clear();
}

bool World::HasEntity(Entity entity) const
{
    return m_transforms.contains(entity) || m_aberrations.contains(entity) || m_names.contains(entity);
}

std::vector<Entity> World::Entities() const
{
    std::unordered_set<Entity> dedup;
    dedup.reserve(m_transforms.size() + m_aberrations.size() + m_names.size());

    auto collect = [&dedup](const auto& map) {
        for (const auto& [entity, _] : map)
        {
            dedup.insert(entity);
        }
    };

    collect(m_transforms);
    collect(m_aberrations);
    collect(m_names);

    std::vector<Entity> entities{dedup.begin(), dedup.end()};
    std::sort(entities.begin(), entities.end());
    return entities;
}
} // namespace engine::scene
