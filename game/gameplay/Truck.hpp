#pragma once

namespace game::gameplay
{
enum class TruckState
{
    Waiting,
    Delivering,
    Returning
};

/// What a single Truck::Update step changed, for event publishing.
enum class TruckTransition
{
    None,
    LeftScreen,
    Returned
};

/// Collects delivered packages and drives off when full.
///
/// The truck may leave the visible screen while delivering, so x is signed;
/// only y is held non-negative.
class Truck
{
public:
    Truck(int originX, int y, int capacity = 8, int speed = 2, int offscreenX = -50);

    /// Adds one package while waiting. Returns true when this package filled the truck.
    bool LoadPackage();

    TruckTransition Update();

    void SetY(int y);

    [[nodiscard]] int X() const { return m_x; }
    [[nodiscard]] int Y() const { return m_y; }
    [[nodiscard]] int OriginX() const { return m_originX; }
    [[nodiscard]] int Load() const { return m_load; }
    [[nodiscard]] int Capacity() const { return m_capacity; }
    [[nodiscard]] int Deliveries() const { return m_deliveries; }
    [[nodiscard]] TruckState State() const { return m_state; }
    [[nodiscard]] bool IsAway() const { return m_state != TruckState::Waiting; }

    [[nodiscard]] static const char* StateToText(TruckState state);

private:
    int m_originX;
    int m_x;
    int m_y = 0;
    int m_capacity;
    int m_speed;
    int m_offscreenX;
    int m_load = 0;
    int m_deliveries = 0;
    TruckState m_state = TruckState::Waiting;
};
} // namespace game::gameplay
