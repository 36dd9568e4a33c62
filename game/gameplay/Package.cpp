#include "game/gameplay/Package.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include "game/gameplay/Character.hpp"

namespace game::gameplay
{
Package::Package(std::uint32_t id, int x, int lane, const LevelLayout& layout)
    : m_id(id)
    , m_lane(lane)
{
    SetX(x);
    SetY(layout.LaneY(lane));
}

PackageStep Package::Advance(const LevelLayout& layout, int tickPeriod, bool receiverAtDeliveryFloor)
{
    if (m_state == PackageState::Delivered)
    {
        return PackageStep::None;
    }

    ++m_auxCounter;
    PackageStep step = PackageStep::None;

    if (m_state == PackageState::Normal && layout.InTransferZone(m_x, Direction()))
    {
        if (m_lane == layout.LastLane())
        {
            if (receiverAtDeliveryFloor)
            {
                m_state = PackageState::Delivered;
                m_caught = false;
                m_carrier.reset();
                return PackageStep::Delivered;
            }
            m_state = PackageState::Falling;
            step = PackageStep::Dropped;
        }
        else if (m_caught)
        {
            Lift(layout);
            step = PackageStep::Lifted;
        }
        else
        {
            m_state = PackageState::Falling;
            step = PackageStep::Dropped;
        }
    }

    if (m_state == PackageState::Falling)
    {
        m_caught = false;
        m_carrier.reset();
        SetY(std::min(m_y + layout.fallStep, layout.FloorY()));
    }

    if (tickPeriod > 0 && m_auxCounter % tickPeriod == 0)
    {
        StepHorizontal(layout);
    }
    return step;
}

bool Package::CheckProximity(Character& character, const LevelLayout& layout)
{
    if (m_state != PackageState::Normal)
    {
        return false;
    }

    const Side side = character.GetSide();
    if (LevelLayout::ReceivingSide(m_lane) != side || !layout.InCatchZone(m_x, side))
    {
        return false;
    }

    // Character stands just above the package row of the lane it serves.
    const int dy = m_y - character.Y();
    if (dy <= 0 || std::abs(dy) >= layout.catchToleranceY)
    {
        return false;
    }

    if (!m_wasCaught)
    {
        character.Catch();
    }
    m_caught = true;
    m_carrier = side;
    character.SetState(CharacterState::Prepared);
    return true;
}

void Package::ClearCaught()
{
    m_wasCaught = m_caught;
    m_caught = false;
    m_carrier.reset();
}

void Package::SetX(int x)
{
    if (x < 0)
    {
        throw std::invalid_argument("package " + std::to_string(m_id) + " x must be non-negative, got " + std::to_string(x));
    }
    m_x = x;
}

void Package::SetY(int y)
{
    if (y < 0)
    {
        throw std::invalid_argument("package " + std::to_string(m_id) + " y must be non-negative, got " + std::to_string(y));
    }
    m_y = y;
}

void Package::Lift(const LevelLayout& layout)
{
    const Side from = LevelLayout::ReceivingSide(m_lane);
    const int nextLane = m_lane + 1;
    if (!layout.IsValidLane(nextLane))
    {
        throw std::out_of_range("package " + std::to_string(m_id) + " lifted past the top lane");
    }

    m_lane = nextLane;
    SetY(layout.LaneY(nextLane));
    SetX(from == Side::Left ? m_x + layout.liftShiftX : m_x - layout.liftShiftX);
    m_caught = false;
    m_carrier.reset();
}

void Package::StepHorizontal(const LevelLayout& layout)
{
    const BeltDirection direction = Direction();
    if (m_state == PackageState::Normal)
    {
        const StairGap& gap = layout.gap;
        if (direction == BeltDirection::Left && m_x > gap.leftEntryMin && m_x < gap.leftEntryMax)
        {
            SetX(gap.leftExit);
            return;
        }
        if (direction == BeltDirection::Right && m_x > gap.rightEntryMin && m_x < gap.rightEntryMax)
        {
            SetX(gap.rightExit);
            return;
        }
    }

    SetX(direction == BeltDirection::Left ? m_x - layout.stepX : m_x + layout.stepX);
}

const char* Package::StateToText(PackageState state)
{
    switch (state)
    {
        case PackageState::Normal: return "normal";
        case PackageState::Falling: return "falling";
        case PackageState::Delivered: return "delivered";
        default: return "unknown";
    }
}
} // namespace game::gameplay
