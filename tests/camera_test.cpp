#include <gtest/gtest.h>

#include <cmath>
#include <optional>

#include <glm/geometric.hpp>

#include "engine/render/Camera.hpp"

using engine::render::Camera;

TEST(CameraTest, DefaultLooksDownNegativeZ)
{
    const Camera camera;
    const glm::vec3 forward = camera.Forward();

    EXPECT_NEAR(forward.x, 0.0F, 1.0e-6F);
    EXPECT_NEAR(forward.y, 0.0F, 1.0e-6F);
    EXPECT_NEAR(forward.z, -1.0F, 1.0e-6F);
    EXPECT_FLOAT_EQ(camera.Position().y, 1.7F);
}

TEST(CameraTest, PositiveYawTurnsLeft)
{
    Camera camera;
    camera.SetYawPitch(1.5707963F, 0.0F);
    const glm::vec3 forward = camera.Forward();

    EXPECT_NEAR(forward.x, -1.0F, 1.0e-5F);
    EXPECT_NEAR(forward.z, 0.0F, 1.0e-5F);
}

TEST(CameraTest, PitchIsClampedShortOfVertical)
{
    Camera camera;
    camera.SetYawPitch(0.0F, 3.0F);
    EXPECT_FLOAT_EQ(camera.Pitch(), Camera::kMaxPitch);

    camera.SetYawPitch(0.0F, -3.0F);
    EXPECT_FLOAT_EQ(camera.Pitch(), -Camera::kMaxPitch);

    // Still a usable look direction.
    EXPECT_LT(camera.Forward().y, -0.99F);
    EXPECT_GT(std::abs(camera.Forward().z), 0.0F);
}

TEST(CameraTest, MouseMotionRotatesOppositeToDelta)
{
    Camera camera;
    camera.ApplyLook({100.0F, 50.0F}, 0.001F);

    EXPECT_NEAR(camera.Yaw(), -0.1F, 1.0e-6F);
    EXPECT_NEAR(camera.Pitch(), -0.05F, 1.0e-6F);

    camera.ApplyLook({0.0F, 0.0F}, 0.001F);
    EXPECT_NEAR(camera.Yaw(), -0.1F, 1.0e-6F);
}

TEST(CameraTest, LookSaturatesAtPitchLimit)
{
    Camera camera;
    for (int i = 0; i < 100; ++i)
    {
        camera.ApplyLook({0.0F, -200.0F}, 0.001F);
    }
    EXPECT_FLOAT_EQ(camera.Pitch(), Camera::kMaxPitch);
}

TEST(CameraTest, ViewportRoundTrip)
{
    Camera camera;
    camera.SetViewportSize({640.0F, 360.0F});
    camera.SetYawPitch(0.3F, -0.2F);

    const glm::vec3 world{1.0F, 1.0F, -3.0F};
    const std::optional<glm::vec2> viewport = camera.WorldToViewport(world);
    ASSERT_TRUE(viewport.has_value());

    const std::optional<engine::render::Ray> ray = camera.ViewportToWorld(*viewport);
    ASSERT_TRUE(ray.has_value());
    const glm::vec3 toWorld = glm::normalize(world - ray->origin);
    EXPECT_NEAR(glm::dot(toWorld, ray->direction), 1.0F, 1.0e-4F);
}

TEST(CameraTest, ViewportOriginIsTopLeft)
{
    Camera camera;
    camera.SetViewportSize({400.0F, 225.0F});

    const std::optional<engine::render::Ray> topLeft = camera.ViewportToWorld({0.0F, 0.0F});
    ASSERT_TRUE(topLeft.has_value());
    EXPECT_LT(topLeft->direction.x, 0.0F);
    EXPECT_GT(topLeft->direction.y, 0.0F);
}
