#include <gtest/gtest.h>

#include <vector>

#include "game/dispel/DispelTargets.hpp"
#include "game/dispel/SpatialProjector.hpp"
#include "test_helpers.hpp"

using namespace game::dispel;

namespace
{
class EnclosureTest : public ::testing::Test
{
protected:
    EnclosureTest()
        : camera(test_helpers::MakeCamera())
        , projector(camera, 2.0F)
    {
    }

    engine::render::Camera camera;
    SpatialProjector projector;
};
} // namespace

TEST_F(EnclosureTest, LoopAroundTargetEnclosesIt)
{
    // (0, 1.7, 0) projects to the window center (400, 225).
    const std::vector<DispelTarget> targets{{7U, {0.0F, 1.7F, 0.0F}}};
    const std::vector<glm::vec2> loop = test_helpers::CirclePoints({400.0F, 225.0F}, 80.0F, 16);

    const std::vector<engine::scene::Entity> enclosed = FindEnclosedTargets(loop, targets, projector);
    ASSERT_EQ(enclosed.size(), 1U);
    EXPECT_EQ(enclosed.front(), 7U);
}

TEST_F(EnclosureTest, LoopElsewhereEnclosesNothing)
{
    const std::vector<DispelTarget> targets{{7U, {0.0F, 1.7F, 0.0F}}};
    const std::vector<glm::vec2> loop = test_helpers::CirclePoints({150.0F, 100.0F}, 60.0F, 16);

    EXPECT_TRUE(FindEnclosedTargets(loop, targets, projector).empty());
}

TEST_F(EnclosureTest, OnlyTargetsInsideAreReturnedInOrder)
{
    const std::vector<DispelTarget> targets{
        {1U, {0.0F, 1.7F, 0.0F}},
        {2U, {3.0F, 1.7F, 0.0F}},
        {3U, {0.2F, 1.8F, -1.0F}},
    };
    const std::vector<glm::vec2> loop = test_helpers::CirclePoints({400.0F, 225.0F}, 100.0F, 24);

    const std::vector<engine::scene::Entity> enclosed = FindEnclosedTargets(loop, targets, projector);
    ASSERT_EQ(enclosed.size(), 2U);
    EXPECT_EQ(enclosed[0], 1U);
    EXPECT_EQ(enclosed[1], 3U);
}

TEST_F(EnclosureTest, TargetsBehindCameraAreSkipped)
{
    const std::vector<DispelTarget> targets{{4U, {0.0F, 1.7F, 12.0F}}};
    // Covers the whole window.
    const std::vector<glm::vec2> loop{{-10.0F, -10.0F}, {900.0F, -10.0F}, {900.0F, 500.0F}, {-10.0F, 500.0F}};

    EXPECT_TRUE(FindEnclosedTargets(loop, targets, projector).empty());
}

TEST_F(EnclosureTest, DegeneratePathEnclosesNothing)
{
    const std::vector<DispelTarget> targets{{1U, {0.0F, 1.7F, 0.0F}}};
    const std::vector<glm::vec2> line{{300.0F, 225.0F}, {500.0F, 225.0F}};

    EXPECT_TRUE(FindEnclosedTargets(line, targets, projector).empty());
    EXPECT_TRUE(FindEnclosedTargets({}, targets, projector).empty());
}

TEST_F(EnclosureTest, NoTargetsYieldsEmptyResult)
{
    const std::vector<glm::vec2> loop = test_helpers::CirclePoints({400.0F, 225.0F}, 80.0F, 16);
    EXPECT_TRUE(FindEnclosedTargets(loop, {}, projector).empty());
}
