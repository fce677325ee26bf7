#include <gtest/gtest.h>

#include <vector>

#include "game/dispel/DispelSystem.hpp"
#include "game/dispel/SpatialProjector.hpp"
#include "test_helpers.hpp"

using namespace game::dispel;

namespace
{
GestureSession DrawingSession(const std::vector<glm::vec2>& path)
{
    GestureSession session;
    session.mode = DispelMode::Drawing;
    session.path = path;
    return session;
}

class ClosureTest : public ::testing::Test
{
protected:
    ClosureTest()
        : camera(test_helpers::MakeCamera())
        , projector(camera, 2.0F)
    {
    }

    engine::render::Camera camera;
    SpatialProjector projector;
    DispelTuning tuning;
    std::vector<DispelTarget> targets;
};
} // namespace

TEST_F(ClosureTest, ClosesWithinDistanceInclusive)
{
    // Start point is (500, 300).
    GestureSession session = DrawingSession(test_helpers::CirclePoints({400.0F, 300.0F}, 100.0F, 12));

    EXPECT_TRUE(IsLoopClosed(session, {530.0F, 300.0F}, tuning));
    EXPECT_FALSE(IsLoopClosed(session, {531.0F, 300.0F}, tuning));

    DispelFrameResult result;
    CheckClosureAndDispel(session, test_helpers::Idle({530.0F, 300.0F}), tuning, projector, targets, result);
    EXPECT_TRUE(result.closed);
    EXPECT_EQ(result.closedPathPoints, 13U) << "closing pointer is appended";
    EXPECT_EQ(session.mode, DispelMode::Dormant);
    EXPECT_TRUE(session.path.empty());
    ASSERT_TRUE(result.cursorRequest.has_value());
    EXPECT_EQ(*result.cursorRequest, HostCursorMode::Captured);
}

TEST_F(ClosureTest, NeverClosesBelowMinPoints)
{
    GestureSession session = DrawingSession(test_helpers::CirclePoints({400.0F, 300.0F}, 100.0F, 9));

    DispelFrameResult result;
    CheckClosureAndDispel(session, test_helpers::Idle({500.0F, 300.0F}), tuning, projector, targets, result);
    EXPECT_FALSE(result.closed);
    EXPECT_EQ(session.mode, DispelMode::Drawing);
    EXPECT_EQ(session.path.size(), 9U);
    EXPECT_FALSE(result.cursorRequest.has_value());
}

TEST_F(ClosureTest, ShortPathEndingAtStartDoesNotClose)
{
    GestureSession session = DrawingSession({{0.0F, 0.0F}, {10.0F, 0.0F}, {10.0F, 10.0F}, {0.0F, 10.0F}, {0.0F, 0.0F}});

    DispelFrameResult result;
    CheckClosureAndDispel(session, test_helpers::Idle({0.0F, 0.0F}), tuning, projector, targets, result);
    EXPECT_FALSE(result.closed);
    EXPECT_EQ(session.path.size(), 5U);
}

TEST_F(ClosureTest, MinPointsIsConfigurable)
{
    tuning.minPoints = 4;
    GestureSession session = DrawingSession({{0.0F, 0.0F}, {10.0F, 0.0F}, {10.0F, 10.0F}, {0.0F, 10.0F}});

    EXPECT_TRUE(IsLoopClosed(session, {0.0F, 2.0F}, tuning));
}

TEST_F(ClosureTest, MissingPointerSkipsClosure)
{
    GestureSession session = DrawingSession(test_helpers::CirclePoints({400.0F, 300.0F}, 100.0F, 12));

    DispelFrameResult result;
    CheckClosureAndDispel(session, PointerState{}, tuning, projector, targets, result);
    EXPECT_FALSE(result.closed);
    EXPECT_EQ(session.path.size(), 12U);
    EXPECT_EQ(session.mode, DispelMode::Drawing);
}

TEST_F(ClosureTest, CancelOnSameFrameWinsOverClosure)
{
    GestureSession session = DrawingSession(test_helpers::CirclePoints({400.0F, 300.0F}, 100.0F, 12));

    DispelFrameResult result;
    CheckClosureAndDispel(session, test_helpers::Cancel({500.0F, 300.0F}), tuning, projector, targets, result);
    EXPECT_FALSE(result.closed);
    EXPECT_EQ(session.path.size(), 12U);
}

TEST_F(ClosureTest, ArmedSessionNeverCloses)
{
    GestureSession session = DrawingSession(test_helpers::CirclePoints({400.0F, 300.0F}, 100.0F, 12));
    session.mode = DispelMode::Armed;

    EXPECT_FALSE(IsLoopClosed(session, {500.0F, 300.0F}, tuning));
}
