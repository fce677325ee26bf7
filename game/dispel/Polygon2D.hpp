#pragma once

#include <vector>

#include <glm/vec2.hpp>

namespace game::dispel
{
/// Even-odd ray casting. Polygons with fewer than 3 vertices contain nothing.
/// Points exactly on an edge get whichever parity the crossing count yields;
/// the answer is stable for identical input but not guaranteed to be "inside".
[[nodiscard]] bool PointInPolygon2D(const std::vector<glm::vec2>& polygon, const glm::vec2& point);
} // namespace game::dispel
