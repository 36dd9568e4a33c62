#include "game/gameplay/LevelLayout.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace game::gameplay
{
LevelLayout LevelLayout::ForBelts(int belts)
{
    if (belts < 1 || belts % 2 == 0)
    {
        throw std::invalid_argument("belt count must be odd and positive, got " + std::to_string(belts));
    }

    LevelLayout layout;
    layout.lanes = belts;
    if (layout.LaneY(layout.LastLane()) < 0)
    {
        throw std::invalid_argument("belt count does not fit the screen: " + std::to_string(belts));
    }
    return layout;
}

int LevelLayout::LaneY(int lane) const
{
    if (!IsValidLane(lane))
    {
        throw std::out_of_range("lane " + std::to_string(lane) + " outside [0, " + std::to_string(lanes) + ")");
    }
    return laneBaseY - lane * laneSpacing;
}

BeltDirection LevelLayout::LaneDirection(int lane)
{
    return (lane % 2 == 0) ? BeltDirection::Left : BeltDirection::Right;
}

Side LevelLayout::ReceivingSide(int lane)
{
    return LaneDirection(lane) == BeltDirection::Left ? Side::Left : Side::Right;
}

int LevelLayout::FloorCount(Side side) const
{
    return side == Side::Left ? (lanes + 1) / 2 : lanes / 2;
}

int LevelLayout::ServedLane(Side side, int floor) const
{
    return side == Side::Left ? floor * 2 : floor * 2 + 1;
}

int LevelLayout::CharacterY(Side side, int floor) const
{
    return LaneY(ServedLane(side, floor)) - characterOffsetY;
}

int LevelLayout::TickPeriod(float speed) const
{
    if (speed <= 0.0F)
    {
        return basePeriod;
    }
    const long period = std::lround(static_cast<float>(basePeriod) / speed);
    return std::max(1, static_cast<int>(period));
}

bool LevelLayout::InTransferZone(int x, BeltDirection direction) const
{
    return direction == BeltDirection::Left ? x < leftTransferX : x > rightTransferX;
}

bool LevelLayout::InCatchZone(int x, Side side) const
{
    return side == Side::Left ? x < leftCatchX : x > rightCatchX;
}
} // namespace game::gameplay
