#include <gtest/gtest.h>

#include <random>

#include "game/gameplay/Difficulty.hpp"
#include "game/gameplay/LevelLayout.hpp"

using game::gameplay::Difficulty;
using game::gameplay::DifficultyId;

TEST(Difficulty, PresetTableMatchesMenuOrder)
{
    const auto& presets = Difficulty::Presets();
    ASSERT_EQ(presets.size(), 4U);
    EXPECT_EQ(presets[0].name, "Easy");
    EXPECT_EQ(presets[1].name, "Medium");
    EXPECT_EQ(presets[2].name, "Extreme");
    EXPECT_EQ(presets[3].name, "Crazy");

    EXPECT_EQ(presets[0].belts, 5);
    EXPECT_EQ(presets[1].belts, 7);
    EXPECT_EQ(presets[2].belts, 9);
    EXPECT_EQ(presets[3].belts, 5);
}

TEST(Difficulty, CrazyHasNoEliminationAndInvertsControls)
{
    const Difficulty& crazy = Difficulty::Preset(DifficultyId::Crazy);
    EXPECT_FALSE(crazy.truckEliminateEvery.has_value());
    EXPECT_TRUE(crazy.invertControls);
    EXPECT_TRUE(crazy.randomPerBelt);
    EXPECT_EQ(crazy.minPackageIncrement, 20);

    const Difficulty& easy = Difficulty::Preset(DifficultyId::Easy);
    ASSERT_TRUE(easy.truckEliminateEvery.has_value());
    EXPECT_EQ(*easy.truckEliminateEvery, 3);
    EXPECT_FALSE(easy.invertControls);
}

TEST(Difficulty, LaneSpeedUsesIntakeOddAndEvenMultipliers)
{
    const Difficulty& extreme = Difficulty::Preset(DifficultyId::Extreme);
    EXPECT_FLOAT_EQ(extreme.LaneSpeed(0), 1.0F);
    EXPECT_FLOAT_EQ(extreme.LaneSpeed(1), 2.0F);
    EXPECT_FLOAT_EQ(extreme.LaneSpeed(2), 1.5F);
    EXPECT_FLOAT_EQ(extreme.LaneSpeed(7), 2.0F);
    EXPECT_FLOAT_EQ(extreme.LaneSpeed(8), 1.5F);
}

TEST(Difficulty, FixedSpeedsIgnoreTheRng)
{
    std::mt19937 rng(7);
    const Difficulty& medium = Difficulty::Preset(DifficultyId::Medium);
    const std::vector<float> speeds = medium.BuildLaneSpeeds(rng);
    ASSERT_EQ(speeds.size(), 7U);
    for (int lane = 0; lane < 7; ++lane)
    {
        EXPECT_FLOAT_EQ(speeds[static_cast<std::size_t>(lane)], medium.LaneSpeed(lane)) << "lane " << lane;
    }
}

TEST(Difficulty, RandomPerBeltDrawsSingleOrDoubleSpeed)
{
    std::mt19937 rng(12345);
    const Difficulty& crazy = Difficulty::Preset(DifficultyId::Crazy);
    for (int round = 0; round < 20; ++round)
    {
        const std::vector<float> speeds = crazy.BuildLaneSpeeds(rng);
        ASSERT_EQ(speeds.size(), 5U);
        for (float speed : speeds)
        {
            EXPECT_TRUE(speed == 1.0F || speed == 2.0F) << speed;
        }
    }
}

TEST(Difficulty, FromNameAcceptsNamesAndMenuDigits)
{
    EXPECT_EQ(Difficulty::FromName("easy"), DifficultyId::Easy);
    EXPECT_EQ(Difficulty::FromName("CRAZY"), DifficultyId::Crazy);
    EXPECT_EQ(Difficulty::FromName("3"), DifficultyId::Extreme);
    EXPECT_EQ(Difficulty::FromName("2"), DifficultyId::Medium);
    EXPECT_FALSE(Difficulty::FromName("nightmare").has_value());
    EXPECT_FALSE(Difficulty::FromName("").has_value());
}

TEST(Difficulty, TickPeriodShrinksWithSpeed)
{
    const auto layout = game::gameplay::LevelLayout::ForBelts(9);
    EXPECT_EQ(layout.TickPeriod(1.0F), 9);
    EXPECT_EQ(layout.TickPeriod(1.5F), 6);
    EXPECT_EQ(layout.TickPeriod(2.0F), 5);
    EXPECT_EQ(layout.TickPeriod(100.0F), 1);
    EXPECT_EQ(layout.TickPeriod(0.0F), 9);
}
