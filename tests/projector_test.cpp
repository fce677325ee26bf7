#include <gtest/gtest.h>

#include <optional>

#include <glm/geometric.hpp>

#include "game/dispel/SpatialProjector.hpp"
#include "test_helpers.hpp"

using game::dispel::SpatialProjector;

TEST(ProjectorTest, CameraViewportIsWindowOverScale)
{
    const engine::render::Camera camera = test_helpers::MakeCamera(2.0F);
    EXPECT_FLOAT_EQ(camera.ViewportSize().x, 400.0F);
    EXPECT_FLOAT_EQ(camera.ViewportSize().y, 225.0F);
}

TEST(ProjectorTest, PointAheadMapsToWindowCenter)
{
    const engine::render::Camera camera = test_helpers::MakeCamera(2.0F);
    const SpatialProjector projector(camera, 2.0F);

    const std::optional<glm::vec2> screen = projector.WorldToScreen({0.0F, 1.7F, 0.0F});
    ASSERT_TRUE(screen.has_value());
    EXPECT_NEAR(screen->x, 400.0F, 1.0e-2F);
    EXPECT_NEAR(screen->y, 225.0F, 1.0e-2F);
}

TEST(ProjectorTest, ScreenYGrowsDownwards)
{
    const engine::render::Camera camera = test_helpers::MakeCamera(2.0F);
    const SpatialProjector projector(camera, 2.0F);

    const std::optional<glm::vec2> high = projector.WorldToScreen({1.0F, 2.7F, 0.0F});
    ASSERT_TRUE(high.has_value());
    EXPECT_LT(high->y, 225.0F);
    EXPECT_GT(high->x, 400.0F);
}

TEST(ProjectorTest, PointBehindCameraHasNoScreenPosition)
{
    const engine::render::Camera camera = test_helpers::MakeCamera(2.0F);
    const SpatialProjector projector(camera, 2.0F);

    EXPECT_FALSE(projector.WorldToScreen({0.0F, 1.7F, 10.0F}).has_value());
    EXPECT_FALSE(projector.WorldToScreen({0.0F, 1.7F, 5.0F}).has_value());
}

TEST(ProjectorTest, PointBeyondFarPlaneHasNoScreenPosition)
{
    const engine::render::Camera camera = test_helpers::MakeCamera(2.0F);
    const SpatialProjector projector(camera, 2.0F);

    EXPECT_FALSE(projector.WorldToScreen({0.0F, 1.7F, -1000.0F}).has_value());
}

TEST(ProjectorTest, CenterRayFollowsCameraForward)
{
    const engine::render::Camera camera = test_helpers::MakeCamera(2.0F);
    const SpatialProjector projector(camera, 2.0F);

    const std::optional<engine::render::Ray> ray = projector.ScreenToWorldRay({400.0F, 225.0F});
    ASSERT_TRUE(ray.has_value());
    EXPECT_NEAR(glm::dot(ray->direction, camera.Forward()), 1.0F, 1.0e-4F);
    EXPECT_NEAR(glm::length(ray->direction), 1.0F, 1.0e-4F);
}

TEST(ProjectorTest, WorldPointRoundTripsThroughScreen)
{
    const engine::render::Camera camera = test_helpers::MakeCamera(2.0F);
    const SpatialProjector projector(camera, 2.0F);

    const glm::vec2 screen{250.0F, 120.0F};
    const std::optional<glm::vec3> world = projector.ScreenToWorldPoint(screen, 3.0F);
    ASSERT_TRUE(world.has_value());

    const std::optional<glm::vec2> back = projector.WorldToScreen(*world);
    ASSERT_TRUE(back.has_value());
    EXPECT_NEAR(back->x, screen.x, 0.05F);
    EXPECT_NEAR(back->y, screen.y, 0.05F);
}

TEST(ProjectorTest, ScaleIsAppliedSymmetrically)
{
    // Same window, different canvas scales: window-space answers must agree.
    const engine::render::Camera fine = test_helpers::MakeCamera(1.0F);
    const engine::render::Camera coarse = test_helpers::MakeCamera(4.0F);
    const SpatialProjector fineProjector(fine, 1.0F);
    const SpatialProjector coarseProjector(coarse, 4.0F);

    const glm::vec3 world{-1.5F, 2.2F, -4.0F};
    const std::optional<glm::vec2> a = fineProjector.WorldToScreen(world);
    const std::optional<glm::vec2> b = coarseProjector.WorldToScreen(world);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_NEAR(a->x, b->x, 0.05F);
    EXPECT_NEAR(a->y, b->y, 0.05F);
}

TEST(ProjectorTest, EmptyViewportProjectsNothing)
{
    engine::render::Camera camera;
    camera.SetViewportSize({0.0F, 0.0F});
    const SpatialProjector projector(camera, 2.0F);

    EXPECT_FALSE(projector.WorldToScreen({0.0F, 1.7F, 0.0F}).has_value());
    EXPECT_FALSE(projector.ScreenToWorldRay({10.0F, 10.0F}).has_value());
    EXPECT_FALSE(projector.ScreenToWorldPoint({10.0F, 10.0F}, 0.5F).has_value());
}
