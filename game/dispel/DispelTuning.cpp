#include "game/dispel/DispelTuning.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

namespace game::dispel
{
namespace
{
using json = nlohmann::json;

void SetError(std::string* outError, const std::string& message)
{
    if (outError != nullptr)
    {
        *outError = message;
    }
}
} // namespace

void SanitizeDispelTuning(DispelTuning& tuning)
{
    tuning.segmentIntervalSeconds = std::clamp(tuning.segmentIntervalSeconds, 0.001F, 1.0F);
    tuning.closureDistance = std::max(1.0F, tuning.closureDistance);
    tuning.minPoints = std::max(3, tuning.minPoints);
    tuning.minPointDistance = std::max(0.0F, tuning.minPointDistance);
    tuning.gizmoDepth = std::max(0.01F, tuning.gizmoDepth);
    tuning.canvasScale = std::clamp(tuning.canvasScale, 1.0F, 8.0F);
}

bool LoadDispelTuning(const std::string& path, DispelTuning& outTuning, std::string* outError)
{
    outTuning = DispelTuning{};

    if (!std::filesystem::exists(path))
    {
        return SaveDispelTuning(path, outTuning, outError);
    }

    std::ifstream stream(path);
    if (!stream.is_open())
    {
        SetError(outError, "Cannot open dispel config: " + path);
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& ex)
    {
        SetError(outError, std::string{"Invalid dispel JSON: "} + ex.what());
        (void)SaveDispelTuning(path, outTuning, nullptr);
        return false;
    }

    if (!root.is_object())
    {
        SetError(outError, "Dispel config root must be an object");
        return false;
    }

    auto readFloat = [&root](const char* key, float& target) {
        if (root.contains(key) && root[key].is_number())
        {
            target = root[key].get<float>();
        }
    };
    auto readInt = [&root](const char* key, int& target) {
        if (root.contains(key) && root[key].is_number_integer())
        {
            target = root[key].get<int>();
        }
    };

    readInt("asset_version", outTuning.assetVersion);
    readFloat("segment_interval", outTuning.segmentIntervalSeconds);
    readFloat("closure_distance", outTuning.closureDistance);
    readInt("min_points", outTuning.minPoints);
    readFloat("min_point_distance", outTuning.minPointDistance);
    readFloat("gizmo_depth", outTuning.gizmoDepth);
    readFloat("canvas_scale", outTuning.canvasScale);

    SanitizeDispelTuning(outTuning);
    return true;
}

bool SaveDispelTuning(const std::string& path, const DispelTuning& tuning, std::string* outError)
{
    const std::filesystem::path filePath(path);
    if (filePath.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(filePath.parent_path(), ec);
    }

    json root;
    root["asset_version"] = tuning.assetVersion;
    root["segment_interval"] = tuning.segmentIntervalSeconds;
    root["closure_distance"] = tuning.closureDistance;
    root["min_points"] = tuning.minPoints;
    root["min_point_distance"] = tuning.minPointDistance;
    root["gizmo_depth"] = tuning.gizmoDepth;
    root["canvas_scale"] = tuning.canvasScale;

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        SetError(outError, "Cannot write dispel config: " + path);
        return false;
    }

    stream << root.dump(2) << "\n";
    return true;
}
} // namespace game::dispel
