#include "game/gameplay/Conveyor.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace game::gameplay
{
Conveyor::Conveyor(int lane, int x, int y, int length, BeltDirection direction, float speed, int tickPeriod, bool intake)
    : m_lane(lane)
    , m_direction(direction)
    , m_speed(speed)
    , m_tickPeriod(tickPeriod)
    , m_intake(intake)
{
    SetX(x);
    SetY(y);
    SetLength(length);
}

std::vector<Conveyor> Conveyor::BuildForLevel(const LevelLayout& layout, const std::vector<float>& laneSpeeds)
{
    if (static_cast<int>(laneSpeeds.size()) != layout.lanes)
    {
        throw std::invalid_argument(
            "expected " + std::to_string(layout.lanes) + " lane speeds, got " + std::to_string(laneSpeeds.size())
        );
    }

    std::vector<Conveyor> conveyors;
    conveyors.reserve(static_cast<std::size_t>(layout.lanes) + 1);
    for (int lane = 0; lane < layout.lanes; ++lane)
    {
        const float speed = laneSpeeds[static_cast<std::size_t>(lane)];
        conveyors.emplace_back(
            lane,
            layout.beltX,
            layout.BeltY(lane),
            layout.beltLength,
            LevelLayout::LaneDirection(lane),
            speed,
            layout.TickPeriod(speed)
        );
    }

    const float intakeSpeed = laneSpeeds.front();
    conveyors.emplace_back(
        0,
        layout.intakeX,
        layout.BeltY(0),
        layout.intakeLength,
        LevelLayout::LaneDirection(0),
        intakeSpeed,
        layout.TickPeriod(intakeSpeed),
        true
    );
    return conveyors;
}

void Conveyor::AddPackage(std::uint32_t id, int x)
{
    if (Contains(id))
    {
        return;
    }

    // Front of the list is the package closest to the delivering end.
    std::size_t index = 0;
    while (index < m_packageXs.size())
    {
        const int other = m_packageXs[index];
        const bool ahead = m_direction == BeltDirection::Left ? other <= x : other >= x;
        if (!ahead)
        {
            break;
        }
        ++index;
    }

    m_packages.insert(m_packages.begin() + static_cast<std::ptrdiff_t>(index), id);
    m_packageXs.insert(m_packageXs.begin() + static_cast<std::ptrdiff_t>(index), x);
}

bool Conveyor::Contains(std::uint32_t id) const
{
    return std::find(m_packages.begin(), m_packages.end(), id) != m_packages.end();
}

void Conveyor::SetX(int x)
{
    if (x < 0)
    {
        throw std::invalid_argument("conveyor x must be non-negative, got " + std::to_string(x));
    }
    m_x = x;
}

void Conveyor::SetY(int y)
{
    if (y < 0)
    {
        throw std::invalid_argument("conveyor y must be non-negative, got " + std::to_string(y));
    }
    m_y = y;
}

void Conveyor::SetLength(int length)
{
    if (length < 0)
    {
        throw std::invalid_argument("conveyor length must be non-negative, got " + std::to_string(length));
    }
    m_length = length;
}
} // namespace game::gameplay
