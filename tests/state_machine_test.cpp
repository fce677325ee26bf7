#include <gtest/gtest.h>

#include <vector>

#include "game/dispel/DispelSystem.hpp"
#include "game/dispel/SpatialProjector.hpp"
#include "test_helpers.hpp"

using namespace game::dispel;
using test_helpers::Cancel;
using test_helpers::Hold;
using test_helpers::Idle;
using test_helpers::Press;
using test_helpers::Release;

namespace
{
constexpr float kFrame = 0.016F;

class StateMachineTest : public ::testing::Test
{
protected:
    StateMachineTest()
        : camera(test_helpers::MakeCamera())
        , projector(camera, 2.0F)
    {
        system.Initialize(DispelTuning{});
    }

    DispelFrameResult Step(const PointerState& pointer, float deltaSeconds = kFrame)
    {
        return system.Update(deltaSeconds, pointer, projector, targets);
    }

    engine::render::Camera camera;
    SpatialProjector projector;
    std::vector<DispelTarget> targets;
    DispelSystem system;
};
} // namespace

TEST_F(StateMachineTest, StartsDormant)
{
    EXPECT_EQ(system.Mode(), DispelMode::Dormant);
    EXPECT_FALSE(system.IsActive());

    const DispelFrameResult result = Step(Idle({10.0F, 10.0F}));
    EXPECT_FALSE(result.cursorRequest.has_value());
    EXPECT_EQ(system.Mode(), DispelMode::Dormant);
}

TEST_F(StateMachineTest, FirstPressArmsAndFreesCursor)
{
    const DispelFrameResult result = Step(Press({10.0F, 10.0F}));

    EXPECT_EQ(system.Mode(), DispelMode::Armed);
    EXPECT_TRUE(system.Path().empty());
    ASSERT_TRUE(result.cursorRequest.has_value());
    EXPECT_EQ(*result.cursorRequest, HostCursorMode::Free);
}

TEST_F(StateMachineTest, SecondPressStartsDrawingAtPointer)
{
    Step(Press({10.0F, 10.0F}));
    Step(Release({10.0F, 10.0F}));
    EXPECT_EQ(system.Mode(), DispelMode::Armed);

    const DispelFrameResult result = Step(Press({200.0F, 150.0F}));
    EXPECT_EQ(system.Mode(), DispelMode::Drawing);
    ASSERT_EQ(system.Path().size(), 1U);
    EXPECT_EQ(system.Path().front(), glm::vec2(200.0F, 150.0F));
    EXPECT_FALSE(result.cursorRequest.has_value());
}

TEST_F(StateMachineTest, PressOutsideWindowStartsEmptyStroke)
{
    Step(Press({10.0F, 10.0F}));

    PointerState outside;
    outside.primaryPressed = true;
    outside.primaryHeld = true;
    Step(outside);

    EXPECT_EQ(system.Mode(), DispelMode::Drawing);
    EXPECT_TRUE(system.Path().empty());
}

TEST_F(StateMachineTest, ReleaseWhileDrawingClearsPath)
{
    Step(Press({10.0F, 10.0F}));
    Step(Press({100.0F, 100.0F}));
    Step(Hold({140.0F, 100.0F}), 0.06F);
    ASSERT_EQ(system.Path().size(), 2U);

    Step(Release({140.0F, 100.0F}));
    EXPECT_EQ(system.Mode(), DispelMode::Drawing);
    EXPECT_TRUE(system.Path().empty());
}

TEST_F(StateMachineTest, PressWhileDrawingStartsFreshStroke)
{
    Step(Press({10.0F, 10.0F}));
    Step(Press({100.0F, 100.0F}));
    Step(Hold({140.0F, 100.0F}), 0.06F);
    Step(Release({140.0F, 100.0F}));

    Step(Press({300.0F, 200.0F}));
    EXPECT_EQ(system.Mode(), DispelMode::Drawing);
    ASSERT_EQ(system.Path().size(), 1U);
    EXPECT_EQ(system.Path().front(), glm::vec2(300.0F, 200.0F));
}

TEST_F(StateMachineTest, CancelFromArmedReturnsToDormant)
{
    Step(Press({10.0F, 10.0F}));

    const DispelFrameResult result = Step(Cancel({10.0F, 10.0F}));
    EXPECT_EQ(system.Mode(), DispelMode::Dormant);
    ASSERT_TRUE(result.cursorRequest.has_value());
    EXPECT_EQ(*result.cursorRequest, HostCursorMode::Captured);
}

TEST_F(StateMachineTest, CancelFromDrawingDiscardsPath)
{
    Step(Press({10.0F, 10.0F}));
    Step(Press({100.0F, 100.0F}));
    Step(Hold({140.0F, 100.0F}), 0.06F);

    const DispelFrameResult result = Step(Cancel({140.0F, 100.0F}));
    EXPECT_EQ(system.Mode(), DispelMode::Dormant);
    EXPECT_TRUE(system.Path().empty());
    EXPECT_TRUE(result.removals.empty());
    ASSERT_TRUE(result.cursorRequest.has_value());
    EXPECT_EQ(*result.cursorRequest, HostCursorMode::Captured);

    Step(Press({50.0F, 50.0F}));
    EXPECT_EQ(system.Mode(), DispelMode::Armed);
    EXPECT_TRUE(system.Path().empty());
}

TEST_F(StateMachineTest, CancelWhileDormantDoesNothing)
{
    const DispelFrameResult result = Step(Cancel({10.0F, 10.0F}));
    EXPECT_EQ(system.Mode(), DispelMode::Dormant);
    EXPECT_FALSE(result.cursorRequest.has_value());
}

TEST_F(StateMachineTest, PressAndCancelOnSameFrameEndsDormant)
{
    PointerState pointer = Press({10.0F, 10.0F});
    pointer.secondaryPressed = true;

    const DispelFrameResult result = Step(pointer);
    EXPECT_EQ(system.Mode(), DispelMode::Dormant);
    ASSERT_TRUE(result.cursorRequest.has_value());
    EXPECT_EQ(*result.cursorRequest, HostCursorMode::Captured);
}

TEST_F(StateMachineTest, CancelWinsOverClosureOnSameFrame)
{
    Step(Press({10.0F, 10.0F}));
    const std::vector<glm::vec2> loop = test_helpers::CirclePoints({400.0F, 225.0F}, 100.0F, 16);
    Step(Press(loop.front()));
    for (std::size_t i = 1; i < loop.size(); ++i)
    {
        Step(Hold(loop[i]), 0.06F);
    }
    ASSERT_EQ(system.Path().size(), loop.size());
    ASSERT_EQ(system.Mode(), DispelMode::Drawing);

    const DispelFrameResult result = Step(Cancel(loop.front()));
    EXPECT_FALSE(result.closed);
    EXPECT_TRUE(result.removals.empty());
    EXPECT_EQ(system.Mode(), DispelMode::Dormant);
    EXPECT_EQ(system.LastDispelCount(), 0);
}

TEST_F(StateMachineTest, HeldButtonDoesNotRetrigger)
{
    Step(Press({10.0F, 10.0F}));
    Step(Hold({10.0F, 10.0F}));
    Step(Hold({10.0F, 10.0F}));
    EXPECT_EQ(system.Mode(), DispelMode::Armed);
}

TEST_F(StateMachineTest, TeardownRestoresCursorOnlyWhenActive)
{
    EXPECT_FALSE(system.Teardown().has_value());

    Step(Press({10.0F, 10.0F}));
    const std::optional<HostCursorMode> restore = system.Teardown();
    ASSERT_TRUE(restore.has_value());
    EXPECT_EQ(*restore, HostCursorMode::Captured);
    EXPECT_EQ(system.Mode(), DispelMode::Dormant);
    EXPECT_TRUE(system.Path().empty());
}
