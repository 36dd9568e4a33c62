#include <gtest/gtest.h>

#include <stdexcept>

#include "game/gameplay/LevelLayout.hpp"

using game::gameplay::BeltDirection;
using game::gameplay::LevelLayout;
using game::gameplay::Side;

TEST(LevelLayout, RejectsEvenOrEmptyBeltCounts)
{
    EXPECT_THROW((void)LevelLayout::ForBelts(4), std::invalid_argument);
    EXPECT_THROW((void)LevelLayout::ForBelts(0), std::invalid_argument);
    EXPECT_THROW((void)LevelLayout::ForBelts(21), std::invalid_argument);
    EXPECT_NO_THROW((void)LevelLayout::ForBelts(9));
}

TEST(LevelLayout, LanesStackUpwardSixteenPixelsApart)
{
    const LevelLayout layout = LevelLayout::ForBelts(5);
    EXPECT_EQ(layout.LaneY(0), 152);
    EXPECT_EQ(layout.LaneY(1), 136);
    EXPECT_EQ(layout.LaneY(4), 88);
    EXPECT_EQ(layout.BeltY(0), 166);
    EXPECT_THROW((void)layout.LaneY(5), std::out_of_range);
    EXPECT_THROW((void)layout.LaneY(-1), std::out_of_range);
}

TEST(LevelLayout, EvenLanesRunLeftOddLanesRight)
{
    EXPECT_EQ(LevelLayout::LaneDirection(0), BeltDirection::Left);
    EXPECT_EQ(LevelLayout::LaneDirection(1), BeltDirection::Right);
    EXPECT_EQ(LevelLayout::LaneDirection(4), BeltDirection::Left);
    EXPECT_EQ(LevelLayout::ReceivingSide(2), Side::Left);
    EXPECT_EQ(LevelLayout::ReceivingSide(3), Side::Right);
}

TEST(LevelLayout, FloorsServeAlternatingLanes)
{
    const LevelLayout layout = LevelLayout::ForBelts(7);
    EXPECT_EQ(layout.FloorCount(Side::Left), 4);
    EXPECT_EQ(layout.FloorCount(Side::Right), 3);
    EXPECT_EQ(layout.ServedLane(Side::Left, 3), 6);
    EXPECT_EQ(layout.ServedLane(Side::Right, 2), 5);
    EXPECT_EQ(layout.DeliveryFloor(), 3);
    EXPECT_EQ(layout.CharacterY(Side::Right, 0), layout.LaneY(1) - 2);
}

TEST(LevelLayout, TruckSitsBelowTheTopLane)
{
    const LevelLayout layout = LevelLayout::ForBelts(5);
    EXPECT_EQ(layout.TruckY(), 94);
    EXPECT_EQ(layout.truckOriginX, 0);
    EXPECT_EQ(layout.truckOffscreenX, -50);
}

TEST(LevelLayout, ZoneThresholdsAreStrict)
{
    const LevelLayout layout = LevelLayout::ForBelts(5);
    EXPECT_TRUE(layout.InTransferZone(44, BeltDirection::Left));
    EXPECT_FALSE(layout.InTransferZone(45, BeltDirection::Left));
    EXPECT_TRUE(layout.InTransferZone(196, BeltDirection::Right));
    EXPECT_FALSE(layout.InTransferZone(195, BeltDirection::Right));

    EXPECT_TRUE(layout.InCatchZone(64, Side::Left));
    EXPECT_FALSE(layout.InCatchZone(65, Side::Left));
    EXPECT_TRUE(layout.InCatchZone(176, Side::Right));
    EXPECT_FALSE(layout.InCatchZone(175, Side::Right));

    EXPECT_TRUE(layout.PastFailEdge(14));
    EXPECT_FALSE(layout.PastFailEdge(15));
    EXPECT_TRUE(layout.PastFailEdge(241));
    EXPECT_FALSE(layout.PastFailEdge(240));
}
