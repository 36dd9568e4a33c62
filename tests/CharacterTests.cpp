#include <gtest/gtest.h>

#include <stdexcept>

#include "game/gameplay/Character.hpp"
#include "game/gameplay/LevelLayout.hpp"

using namespace game::gameplay;

TEST(Character, StartsOnTheBottomFloorOfItsSide)
{
    const LevelLayout layout = LevelLayout::ForBelts(5);
    const Character luigi("Luigi", Side::Left, layout, false);
    const Character mario("Mario", Side::Right, layout, false);

    EXPECT_EQ(luigi.Floor(), 0);
    EXPECT_EQ(luigi.MaxFloor(), 3);
    EXPECT_EQ(luigi.X(), layout.luigiX);
    EXPECT_EQ(luigi.Y(), 150);
    EXPECT_EQ(luigi.ServedLane(), 0);

    EXPECT_EQ(mario.MaxFloor(), 2);
    EXPECT_EQ(mario.X(), layout.marioX);
    EXPECT_EQ(mario.Y(), 134);
    EXPECT_EQ(mario.ServedLane(), 1);
}

TEST(Character, MovesOneFloorWithinBounds)
{
    const LevelLayout layout = LevelLayout::ForBelts(5);
    Character mario("Mario", Side::Right, layout, false);

    EXPECT_FALSE(mario.Move(MoveDirection::Down));
    EXPECT_TRUE(mario.Move(MoveDirection::Up));
    EXPECT_EQ(mario.Floor(), 1);
    EXPECT_EQ(mario.ServedLane(), 3);
    EXPECT_EQ(mario.Y(), layout.LaneY(3) - 2);
    EXPECT_FALSE(mario.Move(MoveDirection::Up));
    EXPECT_EQ(mario.Floor(), 1);
}

TEST(Character, InvertedControlsSwapUpAndDown)
{
    const LevelLayout layout = LevelLayout::ForBelts(5);
    Character luigi("Luigi", Side::Left, layout, true);

    EXPECT_TRUE(luigi.ControlsInverted());
    EXPECT_FALSE(luigi.Move(MoveDirection::Up));
    EXPECT_TRUE(luigi.Move(MoveDirection::Down));
    EXPECT_EQ(luigi.Floor(), 1);
    EXPECT_TRUE(luigi.Move(MoveDirection::Up));
    EXPECT_EQ(luigi.Floor(), 0);
}

TEST(Character, CatchPoseWearsOffAfterSixFrames)
{
    const LevelLayout layout = LevelLayout::ForBelts(5);
    Character luigi("Luigi", Side::Left, layout, false);
    luigi.Catch();
    EXPECT_EQ(luigi.CatchCount(), 1);
    for (int frame = 0; frame < 6; ++frame)
    {
        EXPECT_GT(luigi.CatchPoseFrames(), 0);
        luigi.Update();
    }
    EXPECT_EQ(luigi.CatchPoseFrames(), 0);
    luigi.Update();
    EXPECT_EQ(luigi.CatchPoseFrames(), 0);
}

TEST(Character, ResetStateClearsPrepared)
{
    const LevelLayout layout = LevelLayout::ForBelts(5);
    Character mario("Mario", Side::Right, layout, false);
    mario.SetState(CharacterState::Prepared);
    mario.ResetState();
    EXPECT_EQ(mario.State(), CharacterState::Normal);
}

TEST(Character, RejectsInvalidFloorsAndPositions)
{
    const LevelLayout layout = LevelLayout::ForBelts(5);
    Character mario("Mario", Side::Right, layout, false);
    EXPECT_THROW(mario.SetFloor(2), std::out_of_range);
    EXPECT_THROW(mario.SetFloor(-1), std::out_of_range);
    EXPECT_THROW(mario.SetPosition(-1, 10), std::invalid_argument);
    EXPECT_THROW(mario.SetPosition(10, -1), std::invalid_argument);
}
