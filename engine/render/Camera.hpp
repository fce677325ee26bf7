#pragma once

#include <optional>

#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

namespace engine::render
{
struct Ray
{
    glm::vec3 origin{0.0F};
    glm::vec3 direction{0.0F, 0.0F, -1.0F};

    [[nodiscard]] glm::vec3 PointAt(float distance) const { return origin + direction * distance; }
};

struct CameraProjection
{
    float fovDegrees = 60.0F;
    float nearPlane = 0.05F;
    float farPlane = 400.0F;
};

// First-person camera. Yaw 0 looks down -Z, positive yaw turns left, positive pitch looks up.
// Viewport coordinates have their origin at the top-left corner, y pointing down.
class Camera
{
public:
    static constexpr float kMaxPitch = 1.5607963F;

    void SetPosition(const glm::vec3& position) { m_position = position; }
    void SetYawPitch(float yaw, float pitch);
    void ApplyLook(const glm::vec2& mouseDelta, float sensitivity);
    void SetViewportSize(const glm::vec2& size) { m_viewportSize = size; }
    void SetProjection(const CameraProjection& projection) { m_projection = projection; }

    [[nodiscard]] const glm::vec3& Position() const { return m_position; }
    [[nodiscard]] float Yaw() const { return m_yaw; }
    [[nodiscard]] float Pitch() const { return m_pitch; }
    [[nodiscard]] const glm::vec2& ViewportSize() const { return m_viewportSize; }
    [[nodiscard]] const CameraProjection& Projection() const { return m_projection; }

    [[nodiscard]] glm::vec3 Forward() const;
    [[nodiscard]] glm::mat4 ViewMatrix() const;
    [[nodiscard]] glm::mat4 ProjectionMatrix() const;
    [[nodiscard]] glm::mat4 ViewProjection() const;

    /// Returns none when the point is behind the camera, outside the depth range,
    /// or the viewport is empty.
    [[nodiscard]] std::optional<glm::vec2> WorldToViewport(const glm::vec3& world) const;
    /// Ray starting on the near plane through the given viewport pixel.
    [[nodiscard]] std::optional<Ray> ViewportToWorld(const glm::vec2& viewport) const;

private:
    [[nodiscard]] bool HasViewport() const;

    glm::vec3 m_position{0.0F, 1.7F, 5.0F};
    float m_yaw = 0.0F;
    float m_pitch = 0.0F;
    glm::vec2 m_viewportSize{800.0F, 450.0F};
    CameraProjection m_projection{};
};
} // namespace engine::render
