#include "game/gameplay/Character.hpp"

#include <stdexcept>
#include <utility>

namespace game::gameplay
{
Character::Character(std::string name, Side side, const LevelLayout& layout, bool invertControls)
    : m_name(std::move(name))
    , m_side(side)
    , m_layout(layout)
    , m_inverted(invertControls)
    , m_maxFloor(layout.FloorCount(side))
{
    SetFloor(0);
}

bool Character::Move(MoveDirection direction)
{
    if (m_inverted)
    {
        direction = direction == MoveDirection::Up ? MoveDirection::Down : MoveDirection::Up;
    }

    const int target = direction == MoveDirection::Up ? m_floor + 1 : m_floor - 1;
    if (target < 0 || target >= m_maxFloor)
    {
        return false;
    }

    SetFloor(target);
    return true;
}

void Character::Catch()
{
    ++m_catchCount;
    m_catchPoseFrames = kCatchPoseFrames;
}

void Character::Update()
{
    if (m_catchPoseFrames > 0)
    {
        --m_catchPoseFrames;
    }
}

void Character::SetFloor(int floor)
{
    if (floor < 0 || floor >= m_maxFloor)
    {
        throw std::out_of_range(m_name + " floor " + std::to_string(floor) + " outside [0, " + std::to_string(m_maxFloor) + ")");
    }
    m_floor = floor;
    SetPosition(m_layout.CharacterX(m_side), m_layout.CharacterY(m_side, floor));
}

void Character::SetPosition(int x, int y)
{
    if (x < 0 || y < 0)
    {
        throw std::invalid_argument(m_name + " position must be non-negative");
    }
    m_x = x;
    m_y = y;
}

int Character::ServedLane() const
{
    return m_layout.ServedLane(m_side, m_floor);
}

const char* Character::StateToText(CharacterState state)
{
    switch (state)
    {
        case CharacterState::Normal: return "normal";
        case CharacterState::Prepared: return "prepared";
        default: return "unknown";
    }
}
} // namespace game::gameplay
