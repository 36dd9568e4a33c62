#include "game/gameplay/Truck.hpp"

#include <stdexcept>

namespace game::gameplay
{
Truck::Truck(int originX, int y, int capacity, int speed, int offscreenX)
    : m_originX(originX)
    , m_x(originX)
    , m_capacity(capacity)
    , m_speed(speed)
    , m_offscreenX(offscreenX)
{
    if (capacity <= 0)
    {
        throw std::invalid_argument("truck capacity must be positive");
    }
    if (speed <= 0)
    {
        throw std::invalid_argument("truck speed must be positive");
    }
    if (offscreenX >= originX)
    {
        throw std::invalid_argument("truck off-screen x must lie left of its origin");
    }
    SetY(y);
}

bool Truck::LoadPackage()
{
    if (m_state != TruckState::Waiting)
    {
        return false;
    }

    ++m_load;
    if (m_load >= m_capacity)
    {
        m_state = TruckState::Delivering;
        ++m_deliveries;
        return true;
    }
    return false;
}

TruckTransition Truck::Update()
{
    if (m_state == TruckState::Delivering)
    {
        m_x -= m_speed;
        if (m_x < m_offscreenX)
        {
            m_state = TruckState::Returning;
            m_load = 0;
            return TruckTransition::LeftScreen;
        }
        return TruckTransition::None;
    }

    if (m_state == TruckState::Returning)
    {
        m_x += m_speed;
        if (m_x >= m_originX)
        {
            m_x = m_originX;
            m_state = TruckState::Waiting;
            m_load = 0;
            return TruckTransition::Returned;
        }
    }
    return TruckTransition::None;
}

void Truck::SetY(int y)
{
    if (y < 0)
    {
        throw std::invalid_argument("truck y must be non-negative");
    }
    m_y = y;
}

const char* Truck::StateToText(TruckState state)
{
    switch (state)
    {
        case TruckState::Waiting: return "waiting";
        case TruckState::Delivering: return "delivering";
        case TruckState::Returning: return "returning";
        default: return "unknown";
    }
}
} // namespace game::gameplay
