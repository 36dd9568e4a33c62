#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace game::gameplay
{
/// Gameplay values that live in config/gameplay.json rather than in the difficulty table.
struct GameplayTuning
{
    int assetVersion = 1;

    int spawnTimerMin = 35;
    int spawnTimerMax = 40;
    int spawnTimerRestart = 100;

    int truckCapacity = 8;
    int truckSpeed = 2;
    int truckBonus = 10;

    int missLimit = 3;
    bool beltsRestWhileTruckAway = true;

    int bossMissFrames = 60;
    int bossTruckFrames = 30;

    /// 0 seeds from std::random_device.
    std::uint32_t seed = 0;

    /// Clamps every field into a playable range.
    void Sanitize();

    [[nodiscard]] nlohmann::json ToJson() const;
    /// Reads the keys present in `root`, keeping current values for missing or mistyped keys.
    void ApplyJson(const nlohmann::json& root);

    /// Creates the file with defaults when missing. On a parse error the defaults are kept,
    /// written back, and `outError` describes the problem.
    bool LoadFromFile(const std::string& path, std::string* outError = nullptr);
    bool SaveToFile(const std::string& path, std::string* outError = nullptr) const;
};
} // namespace game::gameplay
