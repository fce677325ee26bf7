#include "game/dispel/Polygon2D.hpp"

#include <cstddef>

namespace game::dispel
{
bool PointInPolygon2D(const std::vector<glm::vec2>& polygon, const glm::vec2& point)
{
    if (polygon.size() < 3U)
    {
        return false;
    }

    bool inside = false;
    std::size_t j = polygon.size() - 1U;
    for (std::size_t i = 0; i < polygon.size(); ++i)
    {
        const glm::vec2& pi = polygon[i];
        const glm::vec2& pj = polygon[j];
        // The straddle check guarantees pj.y != pi.y before dividing.
        const bool intersect =
            ((pi.y > point.y) != (pj.y > point.y)) &&
            (point.x < (pj.x - pi.x) * (point.y - pi.y) / (pj.y - pi.y) + pi.x);
        if (intersect)
        {
            inside = !inside;
        }
        j = i;
    }
    return inside;
}
} // namespace game::dispel
