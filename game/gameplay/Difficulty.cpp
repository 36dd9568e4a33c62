#include "game/gameplay/Difficulty.hpp"

#include <algorithm>
#include <cctype>

namespace game::gameplay
{
namespace
{
Difficulty MakePreset(
    DifficultyId id,
    const char* name,
    int belts,
    float speedIntake,
    float speedEven,
    float speedOdd,
    bool randomPerBelt,
    int minPackageIncrement,
    std::optional<int> truckEliminateEvery,
    bool invertControls
)
{
    Difficulty difficulty;
    difficulty.id = id;
    difficulty.name = name;
    difficulty.belts = belts;
    difficulty.speedIntake = speedIntake;
    difficulty.speedEven = speedEven;
    difficulty.speedOdd = speedOdd;
    difficulty.randomPerBelt = randomPerBelt;
    difficulty.minPackageIncrement = minPackageIncrement;
    difficulty.truckEliminateEvery = truckEliminateEvery;
    difficulty.invertControls = invertControls;
    return difficulty;
}

const std::array<Difficulty, 4> kPresets{
    MakePreset(DifficultyId::Easy, "Easy", 5, 1.0F, 1.0F, 1.0F, false, 50, 3, false),
    MakePreset(DifficultyId::Medium, "Medium", 7, 1.0F, 1.0F, 1.5F, false, 30, 5, false),
    MakePreset(DifficultyId::Extreme, "Extreme", 9, 1.0F, 1.5F, 2.0F, false, 30, 5, false),
    MakePreset(DifficultyId::Crazy, "Crazy", 5, 1.0F, 1.0F, 1.0F, true, 20, std::nullopt, true),
};
} // namespace

float Difficulty::LaneSpeed(int lane) const
{
    if (lane == 0)
    {
        return speedIntake;
    }
    return (lane % 2 == 0) ? speedEven : speedOdd;
}

std::vector<float> Difficulty::BuildLaneSpeeds(std::mt19937& rng) const
{
    std::vector<float> speeds;
    speeds.reserve(static_cast<std::size_t>(std::max(0, belts)));
    std::uniform_int_distribution<int> coin(0, 1);
    for (int lane = 0; lane < belts; ++lane)
    {
        if (randomPerBelt)
        {
            speeds.push_back(coin(rng) == 0 ? 1.0F : 2.0F);
        }
        else
        {
            speeds.push_back(LaneSpeed(lane));
        }
    }
    return speeds;
}

const Difficulty& Difficulty::Preset(DifficultyId id)
{
    return kPresets[static_cast<std::size_t>(id)];
}

const std::array<Difficulty, 4>& Difficulty::Presets()
{
    return kPresets;
}

std::optional<DifficultyId> Difficulty::FromName(const std::string& name)
{
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == "easy" || lowered == "1")
    {
        return DifficultyId::Easy;
    }
    if (lowered == "medium" || lowered == "2")
    {
        return DifficultyId::Medium;
    }
    if (lowered == "extreme" || lowered == "3")
    {
        return DifficultyId::Extreme;
    }
    if (lowered == "crazy" || lowered == "4")
    {
        return DifficultyId::Crazy;
    }
    return std::nullopt;
}

const char* Difficulty::IdToText(DifficultyId id)
{
    switch (id)
    {
        case DifficultyId::Easy: return "easy";
        case DifficultyId::Medium: return "medium";
        case DifficultyId::Extreme: return "extreme";
        case DifficultyId::Crazy: return "crazy";
        default: return "unknown";
    }
}
} // namespace game::gameplay
