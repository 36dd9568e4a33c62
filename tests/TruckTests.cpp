#include <gtest/gtest.h>

#include <stdexcept>

#include "game/gameplay/Truck.hpp"

using namespace game::gameplay;

namespace
{
int UpdateUntil(Truck& truck, TruckTransition expected, int maxFrames = 1000)
{
    for (int frame = 1; frame <= maxFrames; ++frame)
    {
        if (truck.Update() == expected)
        {
            return frame;
        }
    }
    return -1;
}
} // namespace

TEST(Truck, FillsThenDeparts)
{
    Truck truck(0, 94, 3);
    EXPECT_FALSE(truck.LoadPackage());
    EXPECT_FALSE(truck.LoadPackage());
    EXPECT_EQ(truck.State(), TruckState::Waiting);
    EXPECT_TRUE(truck.LoadPackage());
    EXPECT_EQ(truck.State(), TruckState::Delivering);
    EXPECT_EQ(truck.Load(), 3);
    EXPECT_EQ(truck.Deliveries(), 1);
    EXPECT_TRUE(truck.IsAway());
}

TEST(Truck, IgnoresPackagesWhileAway)
{
    Truck truck(0, 94, 1);
    ASSERT_TRUE(truck.LoadPackage());
    EXPECT_FALSE(truck.LoadPackage());
    EXPECT_EQ(truck.Load(), 1);
}

TEST(Truck, WaitingTruckStaysPut)
{
    Truck truck(0, 94);
    EXPECT_EQ(truck.Update(), TruckTransition::None);
    EXPECT_EQ(truck.X(), 0);
}

TEST(Truck, FullCycleReturnsEmptyToOrigin)
{
    Truck truck(0, 94, 1, 2, -50);
    ASSERT_TRUE(truck.LoadPackage());

    EXPECT_EQ(UpdateUntil(truck, TruckTransition::LeftScreen), 26);
    EXPECT_EQ(truck.State(), TruckState::Returning);
    EXPECT_EQ(truck.X(), -52);
    EXPECT_EQ(truck.Load(), 0);

    EXPECT_EQ(UpdateUntil(truck, TruckTransition::Returned), 26);
    EXPECT_EQ(truck.State(), TruckState::Waiting);
    EXPECT_EQ(truck.X(), 0);
    EXPECT_EQ(truck.Load(), 0);
    EXPECT_FALSE(truck.IsAway());
}

TEST(Truck, ReturnsToOriginAtOtherSpeeds)
{
    Truck truck(0, 94, 1, 3, -50);
    ASSERT_TRUE(truck.LoadPackage());
    ASSERT_GT(UpdateUntil(truck, TruckTransition::LeftScreen), 0);
    ASSERT_GT(UpdateUntil(truck, TruckTransition::Returned), 0);
    EXPECT_EQ(truck.X(), 0);
}

TEST(Truck, RejectsInvalidConstruction)
{
    EXPECT_THROW(Truck(0, 94, 0), std::invalid_argument);
    EXPECT_THROW(Truck(0, 94, 8, 0), std::invalid_argument);
    EXPECT_THROW(Truck(0, 94, 8, 2, 10), std::invalid_argument);
    EXPECT_THROW(Truck(0, -1), std::invalid_argument);

    Truck truck(0, 94);
    EXPECT_THROW(truck.SetY(-3), std::invalid_argument);
}
