#include "game/maps/ScenePlacement.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <utility>

#include <nlohmann/json.hpp>

namespace game::maps
{
namespace
{
using json = nlohmann::json;

json Vec3ToJson(const glm::vec3& value)
{
    return json::array({value.x, value.y, value.z});
}

glm::vec3 Vec3FromJson(const json& value, const glm::vec3& fallback)
{
    if (!value.is_array() || value.size() != 3)
    {
        return fallback;
    }
    for (const json& component : value)
    {
        if (!component.is_number())
        {
            return fallback;
        }
    }
    return glm::vec3{
        value.at(0).get<float>(),
        value.at(1).get<float>(),
        value.at(2).get<float>(),
    };
}
} // namespace

ScenePlacement DefaultScenePlacement()
{
    ScenePlacement placement;
    placement.targets = {
        TargetPlacement{"aberration_left", glm::vec3{-4.0F, 1.0F, -6.0F}, 2.0F, false},
        TargetPlacement{"aberration_center", glm::vec3{0.0F, 1.2F, -8.0F}, 2.5F, false},
        TargetPlacement{"aberration_right", glm::vec3{4.5F, 1.0F, -5.0F}, 2.0F, false},
        TargetPlacement{"wanderer", glm::vec3{1.5F, 0.9F, -3.0F}, 1.2F, true},
        TargetPlacement{"aberration_far", glm::vec3{-1.0F, 2.0F, -18.0F}, 3.0F, false},
    };
    return placement;
}

bool LoadScenePlacement(const std::string& path, ScenePlacement& outPlacement, std::string* outError)
{
    outPlacement = DefaultScenePlacement();

    if (!std::filesystem::exists(path))
    {
        return SaveScenePlacement(path, outPlacement, outError);
    }

    std::ifstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Cannot open scene file: " + path;
        }
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& ex)
    {
        if (outError != nullptr)
        {
            *outError = std::string{"Invalid scene JSON: "} + ex.what();
        }
        return false;
    }

    if (!root.is_object())
    {
        if (outError != nullptr)
        {
            *outError = "Scene root must be an object";
        }
        return false;
    }

    ScenePlacement placement;
    placement.assetVersion = root.value("asset_version", 1);

    const json targets = root.value("targets", json::array());
    if (!targets.is_array())
    {
        if (outError != nullptr)
        {
            *outError = "Scene targets must be an array";
        }
        return false;
    }

    for (const json& item : targets)
    {
        if (!item.is_object())
        {
            continue;
        }
        TargetPlacement target;
        target.name = item.value("name", std::string{"aberration"});
        target.position = Vec3FromJson(item.value("position", json::array()), glm::vec3{0.0F});
        target.size = std::max(0.1F, item.value("size", 2.0F));
        target.npc = item.value("npc", false);
        placement.targets.push_back(target);
    }

    outPlacement = std::move(placement);
    return true;
}

bool SaveScenePlacement(const std::string& path, const ScenePlacement& placement, std::string* outError)
{
    const std::filesystem::path filePath(path);
    if (filePath.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(filePath.parent_path(), ec);
    }

    json root;
    root["asset_version"] = placement.assetVersion;
    root["targets"] = json::array();
    for (const TargetPlacement& target : placement.targets)
    {
        root["targets"].push_back(json{
            {"name", target.name},
            {"position", Vec3ToJson(target.position)},
            {"size", target.size},
            {"npc", target.npc},
        });
    }

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Cannot write scene file: " + path;
        }
        return false;
    }

    stream << root.dump(2) << "\n";
    return true;
}

std::size_t SpawnScenePlacement(const ScenePlacement& placement, engine::scene::World& world)
{
    std::size_t spawned = 0;
    for (const TargetPlacement& target : placement.targets)
    {
        const engine::scene::Entity entity = world.CreateEntity();
        world.Transforms()[entity] = engine::scene::Transform{target.position, glm::vec3{0.0F}, glm::vec3{target.size}};
        world.Aberrations()[entity] = engine::scene::AberrationComponent{target.size, target.npc};
        world.Names()[entity] = engine::scene::NameComponent{target.name};
        ++spawned;
    }
    return spawned;
}
} // namespace game::maps
