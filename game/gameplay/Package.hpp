#pragma once

#include <cstdint>
#include <optional>

#include "game/gameplay/LevelLayout.hpp"

namespace game::gameplay
{
class Character;

enum class PackageState
{
    Normal,
    Falling,
    Delivered
};

/// Outcome of one Package::Advance call.
enum class PackageStep
{
    None,
    Lifted,
    Dropped,
    Delivered
};

/// A box travelling across the belts.
///
/// Position is in logical screen pixels. A normal package always sits on the
/// row of its lane; a falling package has left the belt and drops toward the
/// floor row while it keeps drifting in its lane direction.
class Package
{
public:
    Package(std::uint32_t id, int x, int lane, const LevelLayout& layout);

    /// One frame of movement.
    ///
    /// @param layout Geometry of the current level.
    /// @param tickPeriod Frames between horizontal steps for the current lane.
    /// @param receiverAtDeliveryFloor True when Luigi stands on the floor that loads the truck.
    PackageStep Advance(const LevelLayout& layout, int tickPeriod, bool receiverAtDeliveryFloor);

    /// Flags the package as caught when the character stands on its lane inside the catch zone.
    /// Returns true when the package was in reach.
    bool CheckProximity(Character& character, const LevelLayout& layout);

    void ClearCaught();

    void SetX(int x);
    void SetY(int y);

    [[nodiscard]] std::uint32_t Id() const { return m_id; }
    [[nodiscard]] int X() const { return m_x; }
    [[nodiscard]] int Y() const { return m_y; }
    [[nodiscard]] int Lane() const { return m_lane; }
    [[nodiscard]] PackageState State() const { return m_state; }
    [[nodiscard]] bool IsCaught() const { return m_caught; }
    [[nodiscard]] std::optional<Side> Carrier() const { return m_carrier; }
    [[nodiscard]] int AuxCounter() const { return m_auxCounter; }
    [[nodiscard]] BeltDirection Direction() const { return LevelLayout::LaneDirection(m_lane); }

    [[nodiscard]] static const char* StateToText(PackageState state);

private:
    void Lift(const LevelLayout& layout);
    void StepHorizontal(const LevelLayout& layout);

    std::uint32_t m_id;
    int m_x = 0;
    int m_y = 0;
    int m_lane = 0;
    PackageState m_state = PackageState::Normal;
    bool m_caught = false;
    bool m_wasCaught = false;
    std::optional<Side> m_carrier;
    int m_auxCounter = 0;
};
} // namespace game::gameplay
