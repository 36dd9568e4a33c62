#include "game/gameplay/GameplayTuning.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <limits>

namespace game::gameplay
{
using json = nlohmann::json;

void GameplayTuning::Sanitize()
{
    spawnTimerMin = std::max(1, spawnTimerMin);
    spawnTimerMax = std::max(spawnTimerMin, spawnTimerMax);
    spawnTimerRestart = std::max(1, spawnTimerRestart);
    truckCapacity = std::max(1, truckCapacity);
    truckSpeed = std::clamp(truckSpeed, 1, 50);
    truckBonus = std::max(0, truckBonus);
    missLimit = std::max(1, missLimit);
    bossMissFrames = std::max(0, bossMissFrames);
    bossTruckFrames = std::max(0, bossTruckFrames);
}

json GameplayTuning::ToJson() const
{
    json root;
    root["asset_version"] = assetVersion;
    root["spawn_timer_min"] = spawnTimerMin;
    root["spawn_timer_max"] = spawnTimerMax;
    root["spawn_timer_restart"] = spawnTimerRestart;
    root["truck_capacity"] = truckCapacity;
    root["truck_speed"] = truckSpeed;
    root["truck_bonus"] = truckBonus;
    root["miss_limit"] = missLimit;
    root["belts_rest_while_truck_away"] = beltsRestWhileTruckAway;
    root["boss_miss_frames"] = bossMissFrames;
    root["boss_truck_frames"] = bossTruckFrames;
    root["seed"] = seed;
    return root;
}

void GameplayTuning::ApplyJson(const json& root)
{
    if (!root.is_object())
    {
        return;
    }

    auto readInt = [&](const char* key, int& target) {
        if (root.contains(key) && root[key].is_number_integer())
        {
            target = root[key].get<int>();
        }
    };
    auto readBool = [&](const char* key, bool& target) {
        if (root.contains(key) && root[key].is_boolean())
        {
            target = root[key].get<bool>();
        }
    };

    readInt("asset_version", assetVersion);
    readInt("spawn_timer_min", spawnTimerMin);
    readInt("spawn_timer_max", spawnTimerMax);
    readInt("spawn_timer_restart", spawnTimerRestart);
    readInt("truck_capacity", truckCapacity);
    readInt("truck_speed", truckSpeed);
    readInt("truck_bonus", truckBonus);
    readInt("miss_limit", missLimit);
    readBool("belts_rest_while_truck_away", beltsRestWhileTruckAway);
    readInt("boss_miss_frames", bossMissFrames);
    readInt("boss_truck_frames", bossTruckFrames);
    if (root.contains("seed") && root["seed"].is_number_integer())
    {
        const std::int64_t value = root["seed"].get<std::int64_t>();
        if (value >= 0 && value <= static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max()))
        {
            seed = static_cast<std::uint32_t>(value);
        }
    }

    Sanitize();
}

bool GameplayTuning::LoadFromFile(const std::string& path, std::string* outError)
{
    *this = GameplayTuning{};

    const std::filesystem::path filePath(path);
    if (filePath.has_parent_path())
    {
        std::filesystem::create_directories(filePath.parent_path());
    }
    if (!std::filesystem::exists(filePath))
    {
        return SaveToFile(path, outError);
    }

    std::ifstream stream(filePath);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Failed to open gameplay config: " + path;
        }
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& ex)
    {
        if (outError != nullptr)
        {
            *outError = std::string("Invalid gameplay JSON, using defaults: ") + ex.what();
        }
        stream.close();
        std::string saveError;
        if (!SaveToFile(path, &saveError) && outError != nullptr)
        {
            *outError += "; " + saveError;
        }
        return false;
    }

    ApplyJson(root);
    return true;
}

bool GameplayTuning::SaveToFile(const std::string& path, std::string* outError) const
{
    const std::filesystem::path filePath(path);
    if (filePath.has_parent_path())
    {
        std::filesystem::create_directories(filePath.parent_path());
    }

    std::ofstream stream(filePath);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Failed to write gameplay config: " + path;
        }
        return false;
    }

    stream << ToJson().dump(2) << "\n";
    return true;
}
} // namespace game::gameplay
