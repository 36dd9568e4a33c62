#pragma once

#include <array>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace game::gameplay
{
enum class DifficultyId
{
    Easy = 0,
    Medium,
    Extreme,
    Crazy
};

/// Per-game tuning table selected on the main menu.
struct Difficulty
{
    DifficultyId id = DifficultyId::Easy;
    std::string name = "Easy";
    int belts = 5;
    float speedIntake = 1.0F;
    float speedEven = 1.0F;
    float speedOdd = 1.0F;
    bool randomPerBelt = false;
    int minPackageIncrement = 50;
    std::optional<int> truckEliminateEvery = 3;
    bool invertControls = false;

    /// Lane 0 uses the intake speed, odd lanes the odd speed, remaining even lanes the even speed.
    [[nodiscard]] float LaneSpeed(int lane) const;

    /// Speeds for every lane; random-per-belt difficulties draw 1x or 2x per lane.
    [[nodiscard]] std::vector<float> BuildLaneSpeeds(std::mt19937& rng) const;

    [[nodiscard]] static const Difficulty& Preset(DifficultyId id);
    [[nodiscard]] static const std::array<Difficulty, 4>& Presets();
    [[nodiscard]] static std::optional<DifficultyId> FromName(const std::string& name);
    [[nodiscard]] static const char* IdToText(DifficultyId id);
};
} // namespace game::gameplay
