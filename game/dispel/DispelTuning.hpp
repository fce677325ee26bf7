#pragma once

#include <string>

namespace game::dispel
{
struct DispelTuning
{
    int assetVersion = 1;

    // Seconds between path samples while the button is held.
    float segmentIntervalSeconds = 0.05F;
    // Window pixels between the live pointer and the first point that count as a closed loop.
    float closureDistance = 30.0F;
    int minPoints = 10;
    // Window pixels a new sample must be away from the previous one.
    float minPointDistance = 5.0F;
    // World units in front of the camera where feedback is drawn.
    float gizmoDepth = 0.5F;
    // Window pixels per render-canvas pixel.
    float canvasScale = 2.0F;
};

void SanitizeDispelTuning(DispelTuning& tuning);

/// Missing file: defaults are written out and the call succeeds.
/// Malformed file: defaults are applied and written back, the call fails and outError
/// describes the parse error.
[[nodiscard]] bool LoadDispelTuning(const std::string& path, DispelTuning& outTuning, std::string* outError = nullptr);
[[nodiscard]] bool SaveDispelTuning(const std::string& path, const DispelTuning& tuning, std::string* outError = nullptr);
} // namespace game::dispel
