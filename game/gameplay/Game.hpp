#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "game/gameplay/Character.hpp"
#include "game/gameplay/Conveyor.hpp"
#include "game/gameplay/Difficulty.hpp"
#include "game/gameplay/GameplayTuning.hpp"
#include "game/gameplay/LevelLayout.hpp"
#include "game/gameplay/Package.hpp"
#include "game/gameplay/Truck.hpp"

namespace engine::core
{
class EventBus;
}

namespace game::gameplay
{
enum class GamePhase
{
    Menu,
    Playing,
    GameOver
};

/// Input for one tick, already edge-detected by the platform layer.
struct FrameCommands
{
    bool marioUp = false;
    bool marioDown = false;
    bool luigiUp = false;
    bool luigiDown = false;
    std::optional<DifficultyId> selectDifficulty;
    bool restart = false;
    bool backToMenu = false;
    bool quit = false;
};

/// Boss shown after a miss (on the side of the miss) or after the truck returns (no side).
struct BossAlert
{
    int framesLeft = 0;
    std::optional<Side> side;

    [[nodiscard]] bool Active() const { return framesLeft > 0; }
};

/// Owns every entity of a session and advances them one fixed tick at a time.
class Game
{
public:
    explicit Game(GameplayTuning tuning = GameplayTuning{}, engine::core::EventBus* eventBus = nullptr);

    void Update(const FrameCommands& commands);

    void StartGame(DifficultyId id);
    void Restart();
    void BackToMenu();
    void RequestQuit();
    [[nodiscard]] bool QuitRequested() const { return m_quitRequested; }

    /// Places a package at the intake if a game is running and the spawn zone is clear.
    bool ForceSpawn();
    void SetFailures(int failures);

    [[nodiscard]] GamePhase Phase() const { return m_phase; }
    [[nodiscard]] const Difficulty& GetDifficulty() const { return m_difficulty; }
    [[nodiscard]] const LevelLayout& Layout() const { return m_layout; }
    [[nodiscard]] const GameplayTuning& Tuning() const { return m_tuning; }
    [[nodiscard]] const std::vector<float>& LaneSpeeds() const { return m_laneSpeeds; }
    [[nodiscard]] const std::vector<Conveyor>& Conveyors() const { return m_conveyors; }
    [[nodiscard]] const std::vector<Package>& Packages() const { return m_packages; }
    [[nodiscard]] std::vector<Package>& MutablePackages() { return m_packages; }
    [[nodiscard]] const Character& Mario() const { return *m_mario; }
    [[nodiscard]] const Character& Luigi() const { return *m_luigi; }
    [[nodiscard]] Character& MutableMario() { return *m_mario; }
    [[nodiscard]] Character& MutableLuigi() { return *m_luigi; }
    [[nodiscard]] const Truck& GetTruck() const { return *m_truck; }
    [[nodiscard]] const BossAlert& Boss() const { return m_boss; }
    [[nodiscard]] int Score() const { return m_score; }
    [[nodiscard]] int Failures() const { return m_failures; }
    [[nodiscard]] int SpawnTimer() const { return m_spawnTimer; }
    [[nodiscard]] std::uint64_t Frame() const { return m_frame; }

    [[nodiscard]] int MaxPackages() const;
    [[nodiscard]] bool IsSpawnZoneClear() const;
    [[nodiscard]] bool BeltsResting() const;

    [[nodiscard]] std::string DescribeState() const;
    [[nodiscard]] std::string DescribeTruck() const;

    [[nodiscard]] static const char* PhaseToText(GamePhase phase);

private:
    void ResetLevel();
    void UpdatePlaying(const FrameCommands& commands);
    void ApplyMovement(const FrameCommands& commands);
    void UpdateSpawning();
    void UpdatePackages();
    void UpdateTruck();
    void OnPackageDelivered(const Package& package);
    void RegisterMiss(const Package& package);
    void SpawnAtIntake();
    void RefreshConveyorOccupancy();
    [[nodiscard]] int RollSpawnTimer();
    void Publish(const std::string& name, std::vector<std::string> args = {});

    GameplayTuning m_tuning;
    engine::core::EventBus* m_eventBus = nullptr;
    std::mt19937 m_rng;

    GamePhase m_phase = GamePhase::Menu;
    Difficulty m_difficulty;
    LevelLayout m_layout;
    std::vector<float> m_laneSpeeds;
    std::vector<Conveyor> m_conveyors;
    std::vector<Package> m_packages;
    std::optional<Character> m_mario;
    std::optional<Character> m_luigi;
    std::optional<Truck> m_truck;
    BossAlert m_boss;

    int m_score = 0;
    int m_failures = 0;
    int m_spawnTimer = 0;
    std::uint32_t m_nextPackageId = 1;
    std::uint64_t m_frame = 0;
    bool m_quitRequested = false;
};
} // namespace game::gameplay
