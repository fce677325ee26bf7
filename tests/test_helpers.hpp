#pragma once

#include <cmath>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <glm/vec2.hpp>

#include "engine/render/Camera.hpp"
#include "game/dispel/DispelSystem.hpp"

namespace test_helpers
{
// Fresh path under the system temp directory. Any previous file is removed.
inline std::string TempConfigPath(const std::string& fileName)
{
    const std::filesystem::path directory = std::filesystem::temp_directory_path() / "aberrant_tests";
    std::filesystem::create_directories(directory);
    const std::filesystem::path path = directory / fileName;
    std::filesystem::remove(path);
    return path.string();
}

// Default camera at (0, 1.7, 5) looking down -Z, window 800x450 at canvas scale 2.
inline engine::render::Camera MakeCamera(float canvasScale = 2.0F)
{
    engine::render::Camera camera;
    camera.SetViewportSize(glm::vec2{800.0F, 450.0F} / canvasScale);
    return camera;
}

inline game::dispel::PointerState Idle(const glm::vec2& position)
{
    game::dispel::PointerState pointer;
    pointer.position = position;
    return pointer;
}

inline game::dispel::PointerState Press(const glm::vec2& position)
{
    game::dispel::PointerState pointer;
    pointer.position = position;
    pointer.primaryPressed = true;
    pointer.primaryHeld = true;
    return pointer;
}

inline game::dispel::PointerState Hold(const glm::vec2& position)
{
    game::dispel::PointerState pointer;
    pointer.position = position;
    pointer.primaryHeld = true;
    return pointer;
}

inline game::dispel::PointerState Release(const glm::vec2& position)
{
    game::dispel::PointerState pointer;
    pointer.position = position;
    pointer.primaryReleased = true;
    return pointer;
}

inline game::dispel::PointerState Cancel(const glm::vec2& position)
{
    game::dispel::PointerState pointer;
    pointer.position = position;
    pointer.secondaryPressed = true;
    return pointer;
}

// Points on a circle, starting at angle 0 and going counter-clockwise in screen space.
inline std::vector<glm::vec2> CirclePoints(const glm::vec2& center, float radius, int count)
{
    std::vector<glm::vec2> points;
    points.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i)
    {
        const float angle = 6.28318530718F * static_cast<float>(i) / static_cast<float>(count);
        points.emplace_back(center.x + std::cos(angle) * radius, center.y + std::sin(angle) * radius);
    }
    return points;
}
} // namespace test_helpers
