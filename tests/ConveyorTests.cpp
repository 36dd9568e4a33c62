#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "game/gameplay/Conveyor.hpp"

using namespace game::gameplay;

TEST(Conveyor, BuildsOneBeltPerLanePlusIntake)
{
    const LevelLayout layout = LevelLayout::ForBelts(5);
    const std::vector<float> speeds{1.0F, 2.0F, 1.0F, 2.0F, 1.0F};
    const std::vector<Conveyor> conveyors = Conveyor::BuildForLevel(layout, speeds);

    ASSERT_EQ(conveyors.size(), 6U);
    for (int lane = 0; lane < 5; ++lane)
    {
        const Conveyor& conveyor = conveyors[static_cast<std::size_t>(lane)];
        EXPECT_EQ(conveyor.Lane(), lane);
        EXPECT_EQ(conveyor.Y(), layout.BeltY(lane));
        EXPECT_EQ(conveyor.Direction(), LevelLayout::LaneDirection(lane));
        EXPECT_FALSE(conveyor.IsIntake());
    }
    EXPECT_EQ(conveyors[1].TickPeriod(), 5);
    EXPECT_EQ(conveyors[2].TickPeriod(), 9);

    const Conveyor& intake = conveyors.back();
    EXPECT_TRUE(intake.IsIntake());
    EXPECT_EQ(intake.Lane(), 0);
    EXPECT_TRUE(intake.Covers(layout.spawnX));
    EXPECT_FALSE(intake.Covers(layout.intakeX - 1));
}

TEST(Conveyor, RejectsMismatchedSpeedTable)
{
    const LevelLayout layout = LevelLayout::ForBelts(5);
    EXPECT_THROW((void)Conveyor::BuildForLevel(layout, {1.0F, 1.0F}), std::invalid_argument);
}

TEST(Conveyor, KeepsPackagesInTravelOrder)
{
    Conveyor leftward(0, 62, 166, 144, BeltDirection::Left, 1.0F, 9);
    leftward.AddPackage(1, 100);
    leftward.AddPackage(2, 60);
    leftward.AddPackage(3, 140);
    EXPECT_EQ(leftward.Packages(), (std::vector<std::uint32_t>{2, 1, 3}));

    Conveyor rightward(1, 62, 150, 144, BeltDirection::Right, 1.0F, 9);
    rightward.AddPackage(1, 100);
    rightward.AddPackage(2, 60);
    rightward.AddPackage(3, 140);
    EXPECT_EQ(rightward.Packages(), (std::vector<std::uint32_t>{3, 1, 2}));
}

TEST(Conveyor, IgnoresDuplicateIdsAndClears)
{
    Conveyor conveyor(0, 62, 166, 144, BeltDirection::Left, 1.0F, 9);
    conveyor.AddPackage(4, 80);
    conveyor.AddPackage(4, 80);
    conveyor.AddPackage(5, 120);
    EXPECT_EQ(conveyor.Packages().size(), 2U);
    EXPECT_TRUE(conveyor.Contains(4));
    EXPECT_FALSE(conveyor.Contains(6));

    conveyor.ClearPackages();
    EXPECT_TRUE(conveyor.Packages().empty());
}

TEST(Conveyor, RejectsNegativeGeometry)
{
    Conveyor conveyor(0, 62, 166, 144, BeltDirection::Left, 1.0F, 9);
    EXPECT_THROW(conveyor.SetX(-1), std::invalid_argument);
    EXPECT_THROW(conveyor.SetY(-1), std::invalid_argument);
    EXPECT_THROW(conveyor.SetLength(-1), std::invalid_argument);
    EXPECT_THROW(Conveyor(0, -5, 166, 144, BeltDirection::Left, 1.0F, 9), std::invalid_argument);
}
