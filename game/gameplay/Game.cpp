#include "game/gameplay/Game.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include "engine/core/EventBus.hpp"

namespace game::gameplay
{
namespace
{
const char* SideToText(Side side)
{
    return side == Side::Left ? "left" : "right";
}

std::uint32_t SeedFrom(std::uint32_t configured)
{
    if (configured != 0)
    {
        return configured;
    }
    std::random_device device;
    return device();
}
} // namespace

Game::Game(GameplayTuning tuning, engine::core::EventBus* eventBus)
    : m_tuning(std::move(tuning))
    , m_eventBus(eventBus)
    , m_rng(SeedFrom(m_tuning.seed))
    , m_difficulty(Difficulty::Preset(DifficultyId::Easy))
{
    m_tuning.Sanitize();
    // The menu draws over an idle Easy level so every entity always exists.
    ResetLevel();
}

void Game::Update(const FrameCommands& commands)
{
    ++m_frame;

    if (commands.quit)
    {
        RequestQuit();
        return;
    }

    switch (m_phase)
    {
        case GamePhase::Menu:
            if (commands.selectDifficulty.has_value())
            {
                StartGame(*commands.selectDifficulty);
            }
            return;
        case GamePhase::GameOver:
            if (commands.restart)
            {
                Restart();
            }
            else if (commands.backToMenu)
            {
                BackToMenu();
            }
            return;
        case GamePhase::Playing:
            UpdatePlaying(commands);
            return;
        default:
            return;
    }
}

void Game::StartGame(DifficultyId id)
{
    m_difficulty = Difficulty::Preset(id);
    ResetLevel();
    m_phase = GamePhase::Playing;
    Publish("game_started", {m_difficulty.name});
}

void Game::Restart()
{
    ResetLevel();
    m_phase = GamePhase::Playing;
    Publish("game_restarted", {m_difficulty.name});
}

void Game::BackToMenu()
{
    m_phase = GamePhase::Menu;
    Publish("menu_entered");
}

void Game::RequestQuit()
{
    if (!m_quitRequested)
    {
        m_quitRequested = true;
        Publish("quit_requested");
    }
}

bool Game::ForceSpawn()
{
    if (m_phase != GamePhase::Playing || !IsSpawnZoneClear())
    {
        return false;
    }
    SpawnAtIntake();
    RefreshConveyorOccupancy();
    return true;
}

void Game::SetFailures(int failures)
{
    m_failures = std::max(0, failures);
}

int Game::MaxPackages() const
{
    const int increment = std::max(1, m_difficulty.minPackageIncrement);
    return 1 + m_score / increment;
}

bool Game::IsSpawnZoneClear() const
{
    return std::none_of(m_packages.begin(), m_packages.end(), [this](const Package& package) {
        return package.Lane() == 0 && package.X() > m_layout.spawnZoneX;
    });
}

bool Game::BeltsResting() const
{
    return m_tuning.beltsRestWhileTruckAway && m_truck->IsAway();
}

void Game::ResetLevel()
{
    m_layout = LevelLayout::ForBelts(m_difficulty.belts);
    m_laneSpeeds = m_difficulty.BuildLaneSpeeds(m_rng);
    m_conveyors = Conveyor::BuildForLevel(m_layout, m_laneSpeeds);
    m_packages.clear();
    m_mario.emplace("Mario", Side::Right, m_layout, m_difficulty.invertControls);
    m_luigi.emplace("Luigi", Side::Left, m_layout, m_difficulty.invertControls);
    m_truck.emplace(m_layout.truckOriginX, m_layout.TruckY(), m_tuning.truckCapacity, m_tuning.truckSpeed, m_layout.truckOffscreenX);
    m_boss = BossAlert{};
    m_score = 0;
    m_failures = 0;
    m_spawnTimer = m_tuning.spawnTimerRestart;
    m_nextPackageId = 1;

    SpawnAtIntake();
    RefreshConveyorOccupancy();
}

void Game::UpdatePlaying(const FrameCommands& commands)
{
    ApplyMovement(commands);

    const bool resting = BeltsResting();
    if (!resting)
    {
        UpdateSpawning();
    }

    m_mario->ResetState();
    m_luigi->ResetState();

    if (!resting)
    {
        UpdatePackages();
    }
    RefreshConveyorOccupancy();

    m_mario->Update();
    m_luigi->Update();
    UpdateTruck();

    if (m_boss.framesLeft > 0)
    {
        --m_boss.framesLeft;
    }

    if (m_failures >= m_tuning.missLimit)
    {
        m_phase = GamePhase::GameOver;
        Publish("game_over", {std::to_string(m_score)});
    }
}

void Game::ApplyMovement(const FrameCommands& commands)
{
    if (commands.marioUp)
    {
        m_mario->Move(MoveDirection::Up);
    }
    if (commands.marioDown)
    {
        m_mario->Move(MoveDirection::Down);
    }
    if (commands.luigiUp)
    {
        m_luigi->Move(MoveDirection::Up);
    }
    if (commands.luigiDown)
    {
        m_luigi->Move(MoveDirection::Down);
    }
}

void Game::UpdateSpawning()
{
    if (m_spawnTimer > 0)
    {
        --m_spawnTimer;
    }

    const bool belowCap = static_cast<int>(m_packages.size()) < MaxPackages();
    if (m_spawnTimer == 0 && belowCap && IsSpawnZoneClear())
    {
        SpawnAtIntake();
        m_spawnTimer = RollSpawnTimer();
    }
}

void Game::UpdatePackages()
{
    const bool luigiAtDelivery = m_luigi->Floor() == m_layout.DeliveryFloor();

    for (auto it = m_packages.begin(); it != m_packages.end();)
    {
        Package& package = *it;
        const int lane = package.Lane();
        const int period = m_conveyors[static_cast<std::size_t>(lane)].TickPeriod();

        const PackageStep step = package.Advance(m_layout, period, luigiAtDelivery);
        if (step == PackageStep::Lifted)
        {
            Publish("package_lifted", {std::to_string(package.Id()), std::to_string(lane), std::to_string(package.Lane())});
        }
        else if (step == PackageStep::Dropped)
        {
            Publish("package_dropped", {std::to_string(package.Id()), std::to_string(lane)});
        }

        if (package.State() == PackageState::Delivered)
        {
            OnPackageDelivered(package);
            it = m_packages.erase(it);
            continue;
        }

        if (m_layout.PastFailEdge(package.X()))
        {
            RegisterMiss(package);
            it = m_packages.erase(it);
            continue;
        }

        package.ClearCaught();
        package.CheckProximity(*m_mario, m_layout);
        package.CheckProximity(*m_luigi, m_layout);
        ++it;
    }
}

void Game::UpdateTruck()
{
    switch (m_truck->Update())
    {
        case TruckTransition::LeftScreen:
            Publish("truck_left_screen");
            break;
        case TruckTransition::Returned:
            m_boss.framesLeft = m_tuning.bossTruckFrames;
            m_boss.side.reset();
            Publish("truck_returned");
            break;
        case TruckTransition::None:
        default:
            break;
    }
}

void Game::OnPackageDelivered(const Package& package)
{
    ++m_score;
    Publish("package_delivered", {std::to_string(package.Id()), std::to_string(m_score)});

    if (!m_truck->LoadPackage())
    {
        return;
    }

    m_score += m_tuning.truckBonus;
    Publish("truck_departed", {std::to_string(m_truck->Deliveries()), std::to_string(m_score)});

    const std::optional<int>& every = m_difficulty.truckEliminateEvery;
    if (every.has_value() && *every > 0 && m_truck->Deliveries() % *every == 0 && m_failures > 0)
    {
        --m_failures;
        Publish("failure_eliminated", {std::to_string(m_failures)});
    }
}

void Game::RegisterMiss(const Package& package)
{
    const Side side = package.X() < m_layout.leftFailX ? Side::Left : Side::Right;
    ++m_failures;
    m_boss.framesLeft = m_tuning.bossMissFrames;
    m_boss.side = side;
    Publish("package_missed", {std::to_string(package.Id()), SideToText(side), std::to_string(m_failures)});
}

void Game::SpawnAtIntake()
{
    const std::uint32_t id = m_nextPackageId++;
    m_packages.emplace_back(id, m_layout.spawnX, 0, m_layout);
    Publish("package_spawned", {std::to_string(id)});
}

void Game::RefreshConveyorOccupancy()
{
    for (Conveyor& conveyor : m_conveyors)
    {
        conveyor.ClearPackages();
    }

    for (const Package& package : m_packages)
    {
        if (package.State() != PackageState::Normal)
        {
            continue;
        }

        Conveyor* target = &m_conveyors[static_cast<std::size_t>(package.Lane())];
        if (package.Lane() == 0)
        {
            Conveyor& intake = m_conveyors.back();
            if (intake.Covers(package.X()))
            {
                target = &intake;
            }
        }
        target->AddPackage(package.Id(), package.X());
    }
}

int Game::RollSpawnTimer()
{
    std::uniform_int_distribution<int> dist(m_tuning.spawnTimerMin, m_tuning.spawnTimerMax);
    return dist(m_rng);
}

void Game::Publish(const std::string& name, std::vector<std::string> args)
{
    if (m_eventBus == nullptr)
    {
        return;
    }
    m_eventBus->Publish(engine::core::Event{name, std::move(args), m_frame});
}

std::string Game::DescribeState() const
{
    std::ostringstream oss;
    oss << "phase=" << PhaseToText(m_phase) << " difficulty=" << m_difficulty.name << " frame=" << m_frame << "\n";
    oss << "score=" << m_score << " failures=" << m_failures << "/" << m_tuning.missLimit
        << " packages=" << m_packages.size() << "/" << MaxPackages() << " spawn_timer=" << m_spawnTimer
        << " resting=" << (BeltsResting() ? "yes" : "no") << "\n";
    for (const Character* character : {&*m_mario, &*m_luigi})
    {
        oss << "  " << character->Name() << " floor=" << character->Floor() << "/" << character->MaxFloor()
            << " lane=" << character->ServedLane() << " state=" << Character::StateToText(character->State())
            << " catches=" << character->CatchCount() << "\n";
    }
    for (const Package& package : m_packages)
    {
        oss << "  package " << package.Id() << " lane=" << package.Lane() << " x=" << package.X() << " y=" << package.Y()
            << " state=" << Package::StateToText(package.State()) << (package.IsCaught() ? " caught" : "") << "\n";
    }
    return oss.str();
}

std::string Game::DescribeTruck() const
{
    std::ostringstream oss;
    oss << "truck state=" << Truck::StateToText(m_truck->State()) << " x=" << m_truck->X() << " y=" << m_truck->Y()
        << " load=" << m_truck->Load() << "/" << m_truck->Capacity() << " deliveries=" << m_truck->Deliveries();
    return oss.str();
}

const char* Game::PhaseToText(GamePhase phase)
{
    switch (phase)
    {
        case GamePhase::Menu: return "menu";
        case GamePhase::Playing: return "playing";
        case GamePhase::GameOver: return "game_over";
        default: return "unknown";
    }
}
} // namespace game::gameplay
