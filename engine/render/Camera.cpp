#include "engine/render/Camera.hpp"

#include <cmath>

#include <glm/common.hpp>
#include <glm/geometric.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/vec4.hpp>

namespace engine::render
{
void Camera::SetYawPitch(float yaw, float pitch)
{
    m_yaw = yaw;
    m_pitch = glm::clamp(pitch, -kMaxPitch, kMaxPitch);
}

void Camera::ApplyLook(const glm::vec2& mouseDelta, float sensitivity)
{
    if (mouseDelta.x == 0.0F && mouseDelta.y == 0.0F)
    {
        return;
    }
    SetYawPitch(m_yaw - mouseDelta.x * sensitivity, m_pitch - mouseDelta.y * sensitivity);
}

glm::vec3 Camera::Forward() const
{
    const float cosPitch = std::cos(m_pitch);
    return glm::vec3{
        -std::sin(m_yaw) * cosPitch,
        std::sin(m_pitch),
        -std::cos(m_yaw) * cosPitch,
    };
}

glm::mat4 Camera::ViewMatrix() const
{
    return glm::lookAt(m_position, m_position + Forward(), glm::vec3{0.0F, 1.0F, 0.0F});
}

glm::mat4 Camera::ProjectionMatrix() const
{
    const float aspect = HasViewport() ? m_viewportSize.x / m_viewportSize.y : (16.0F / 9.0F);
    return glm::perspective(glm::radians(m_projection.fovDegrees), aspect, m_projection.nearPlane, m_projection.farPlane);
}

glm::mat4 Camera::ViewProjection() const
{
    return ProjectionMatrix() * ViewMatrix();
}

bool Camera::HasViewport() const
{
    return m_viewportSize.x > 0.0F && m_viewportSize.y > 0.0F;
}

std::optional<glm::vec2> Camera::WorldToViewport(const glm::vec3& world) const
{
    if (!HasViewport())
    {
        return std::nullopt;
    }

    const glm::vec4 clip = ViewProjection() * glm::vec4(world, 1.0F);
    if (clip.w <= 1.0e-6F)
    {
        return std::nullopt;
    }
    const glm::vec3 ndc = glm::vec3(clip) / clip.w;
    if (ndc.z < -1.0F || ndc.z > 1.0F)
    {
        return std::nullopt;
    }

    return glm::vec2{
        (ndc.x * 0.5F + 0.5F) * m_viewportSize.x,
        (1.0F - (ndc.y * 0.5F + 0.5F)) * m_viewportSize.y,
    };
}

std::optional<Ray> Camera::ViewportToWorld(const glm::vec2& viewport) const
{
    if (!HasViewport())
    {
        return std::nullopt;
    }

    const float x = (2.0F * viewport.x) / m_viewportSize.x - 1.0F;
    const float y = 1.0F - (2.0F * viewport.y) / m_viewportSize.y;
    const glm::mat4 inv = glm::inverse(ViewProjection());

    const glm::vec4 nearClip = inv * glm::vec4{x, y, -1.0F, 1.0F};
    const glm::vec4 farClip = inv * glm::vec4{x, y, 1.0F, 1.0F};
    if (std::abs(nearClip.w) < 1.0e-6F || std::abs(farClip.w) < 1.0e-6F)
    {
        return std::nullopt;
    }

    const glm::vec3 nearWorld = glm::vec3(nearClip) / nearClip.w;
    const glm::vec3 farWorld = glm::vec3(farClip) / farClip.w;
    const glm::vec3 direction = farWorld - nearWorld;
    if (glm::length(direction) < 1.0e-6F)
    {
        return std::nullopt;
    }

    return Ray{nearWorld, glm::normalize(direction)};
}
} // namespace engine::render
