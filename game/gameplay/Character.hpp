#pragma once

#include <string>

#include "game/gameplay/LevelLayout.hpp"

namespace game::gameplay
{
enum class CharacterState
{
    Normal,
    Prepared
};

enum class MoveDirection
{
    Up,
    Down
};

/// Mario or Luigi. Moves only vertically between the floors on its side.
class Character
{
public:
    Character(std::string name, Side side, const LevelLayout& layout, bool invertControls);

    /// Applies one key-press edge. Returns true when the floor changed.
    bool Move(MoveDirection direction);

    /// Called on the frame a package first becomes caught by this character.
    void Catch();

    void Update();
    void ResetState() { m_state = CharacterState::Normal; }

    void SetFloor(int floor);
    void SetPosition(int x, int y);

    [[nodiscard]] const std::string& Name() const { return m_name; }
    [[nodiscard]] Side GetSide() const { return m_side; }
    [[nodiscard]] int Floor() const { return m_floor; }
    [[nodiscard]] int MaxFloor() const { return m_maxFloor; }
    [[nodiscard]] int ServedLane() const;
    [[nodiscard]] int X() const { return m_x; }
    [[nodiscard]] int Y() const { return m_y; }
    [[nodiscard]] CharacterState State() const { return m_state; }
    void SetState(CharacterState state) { m_state = state; }
    [[nodiscard]] int CatchCount() const { return m_catchCount; }
    [[nodiscard]] int CatchPoseFrames() const { return m_catchPoseFrames; }
    [[nodiscard]] bool ControlsInverted() const { return m_inverted; }

    [[nodiscard]] static const char* StateToText(CharacterState state);

private:
    static constexpr int kCatchPoseFrames = 6;

    std::string m_name;
    Side m_side;
    LevelLayout m_layout;
    bool m_inverted;

    int m_floor = 0;
    int m_maxFloor = 1;
    int m_x = 0;
    int m_y = 0;
    CharacterState m_state = CharacterState::Normal;
    int m_catchCount = 0;
    int m_catchPoseFrames = 0;
};
} // namespace game::gameplay
