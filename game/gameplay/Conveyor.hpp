#pragma once

#include <cstdint>
#include <vector>

#include "game/gameplay/LevelLayout.hpp"

namespace game::gameplay
{
/// One belt segment. Holds the ids of the normal packages currently riding it, in travel order.
class Conveyor
{
public:
    Conveyor(int lane, int x, int y, int length, BeltDirection direction, float speed, int tickPeriod, bool intake = false);

    /// One belt per lane plus the intake belt on lane 0.
    [[nodiscard]] static std::vector<Conveyor> BuildForLevel(const LevelLayout& layout, const std::vector<float>& laneSpeeds);

    [[nodiscard]] bool Covers(int x) const { return x >= m_x && x < m_x + m_length; }

    void ClearPackages()
    {
        m_packages.clear();
        m_packageXs.clear();
    }
    /// Inserts keeping the front of the list nearest the end the belt moves toward.
    void AddPackage(std::uint32_t id, int x);
    [[nodiscard]] bool Contains(std::uint32_t id) const;

    void SetX(int x);
    void SetY(int y);
    void SetLength(int length);

    [[nodiscard]] int Lane() const { return m_lane; }
    [[nodiscard]] int X() const { return m_x; }
    [[nodiscard]] int Y() const { return m_y; }
    [[nodiscard]] int Length() const { return m_length; }
    [[nodiscard]] BeltDirection Direction() const { return m_direction; }
    [[nodiscard]] float Speed() const { return m_speed; }
    [[nodiscard]] int TickPeriod() const { return m_tickPeriod; }
    [[nodiscard]] bool IsIntake() const { return m_intake; }
    [[nodiscard]] const std::vector<std::uint32_t>& Packages() const { return m_packages; }

private:
    int m_lane;
    int m_x = 0;
    int m_y = 0;
    int m_length = 0;
    BeltDirection m_direction;
    float m_speed;
    int m_tickPeriod;
    bool m_intake;
    std::vector<std::uint32_t> m_packages;
    std::vector<int> m_packageXs;
};
} // namespace game::gameplay
