#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "game/gameplay/GameplayTuning.hpp"

using game::gameplay::GameplayTuning;

namespace
{
class GameplayTuningFileTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        directory = std::filesystem::temp_directory_path() /
                    ("beltbros_tuning_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(directory);
        path = directory / "config" / "gameplay.json";
    }

    void TearDown() override { std::filesystem::remove_all(directory); }

    void WriteRaw(const std::string& text) const
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream stream(path);
        stream << text;
    }

    std::filesystem::path directory;
    std::filesystem::path path;
};
} // namespace

TEST(GameplayTuning, DefaultsMatchTheArcadeRules)
{
    const GameplayTuning tuning;
    EXPECT_EQ(tuning.spawnTimerMin, 35);
    EXPECT_EQ(tuning.spawnTimerMax, 40);
    EXPECT_EQ(tuning.spawnTimerRestart, 100);
    EXPECT_EQ(tuning.truckCapacity, 8);
    EXPECT_EQ(tuning.missLimit, 3);
    EXPECT_TRUE(tuning.beltsRestWhileTruckAway);
}

TEST(GameplayTuning, ApplyJsonKeepsMissingAndMistypedKeys)
{
    GameplayTuning tuning;
    tuning.ApplyJson(nlohmann::json{{"truck_capacity", 4}, {"miss_limit", "many"}, {"seed", 77}});
    EXPECT_EQ(tuning.truckCapacity, 4);
    EXPECT_EQ(tuning.missLimit, 3);
    EXPECT_EQ(tuning.seed, 77U);
    EXPECT_EQ(tuning.spawnTimerMin, 35);
}

TEST(GameplayTuning, SeedOutsideUnsignedRangeIsIgnored)
{
    GameplayTuning tuning;
    tuning.seed = 11U;
    tuning.ApplyJson(nlohmann::json{{"seed", 4294967296LL}});
    EXPECT_EQ(tuning.seed, 11U);
    tuning.ApplyJson(nlohmann::json{{"seed", -1}});
    EXPECT_EQ(tuning.seed, 11U);
    tuning.ApplyJson(nlohmann::json::parse(R"({"seed": 18446744073709551615})"));
    EXPECT_EQ(tuning.seed, 11U);

    tuning.ApplyJson(nlohmann::json{{"seed", 4294967295LL}});
    EXPECT_EQ(tuning.seed, 4294967295U);
}

TEST(GameplayTuning, SanitizeClampsIntoPlayableRanges)
{
    GameplayTuning tuning;
    tuning.ApplyJson(nlohmann::json{{"spawn_timer_min", 50}, {"spawn_timer_max", 10}, {"truck_speed", 0}, {"miss_limit", -2}});
    EXPECT_EQ(tuning.spawnTimerMin, 50);
    EXPECT_EQ(tuning.spawnTimerMax, 50);
    EXPECT_EQ(tuning.truckSpeed, 1);
    EXPECT_EQ(tuning.missLimit, 1);
}

TEST_F(GameplayTuningFileTest, MissingFileIsCreatedWithDefaults)
{
    GameplayTuning tuning;
    std::string error;
    ASSERT_TRUE(tuning.LoadFromFile(path.string(), &error)) << error;
    EXPECT_TRUE(std::filesystem::exists(path));

    std::ifstream stream(path);
    const nlohmann::json root = nlohmann::json::parse(stream);
    EXPECT_EQ(root.at("truck_capacity").get<int>(), 8);
    EXPECT_EQ(root.at("belts_rest_while_truck_away").get<bool>(), true);
}

TEST_F(GameplayTuningFileTest, SavedValuesLoadBack)
{
    GameplayTuning saved;
    saved.truckBonus = 25;
    saved.beltsRestWhileTruckAway = false;
    saved.seed = 9U;
    ASSERT_TRUE(saved.SaveToFile(path.string()));

    GameplayTuning loaded;
    ASSERT_TRUE(loaded.LoadFromFile(path.string()));
    EXPECT_EQ(loaded.truckBonus, 25);
    EXPECT_FALSE(loaded.beltsRestWhileTruckAway);
    EXPECT_EQ(loaded.seed, 9U);
}

TEST_F(GameplayTuningFileTest, InvalidJsonFallsBackToDefaultsAndRewritesTheFile)
{
    WriteRaw("{ not json");
    GameplayTuning tuning;
    tuning.missLimit = 9;
    std::string error;
    EXPECT_FALSE(tuning.LoadFromFile(path.string(), &error));
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(tuning.missLimit, 3);

    GameplayTuning reloaded;
    EXPECT_TRUE(reloaded.LoadFromFile(path.string()));
}
