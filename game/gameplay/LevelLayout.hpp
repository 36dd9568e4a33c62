#pragma once

namespace game::gameplay
{
enum class BeltDirection
{
    Left,
    Right
};

/// Which end of the belts a character works. Luigi stands left, Mario right.
enum class Side
{
    Left,
    Right
};

struct StairGap
{
    int leftEntryMin = 118;
    int leftEntryMax = 152;
    int leftExit = 104;
    int rightEntryMin = 100;
    int rightEntryMax = 150;
    int rightExit = 150;
};

/// Lane and floor geometry of one level, in logical screen pixels (256x192).
///
/// Lane 0 is the bottom belt. Even lanes carry packages left toward Luigi,
/// odd lanes right toward Mario. Luigi's floor f serves lane 2f and Mario's
/// floor f serves lane 2f + 1, so the top lane always ends at Luigi and the truck.
struct LevelLayout
{
    int lanes = 5;

    int laneBaseY = 152;
    int laneSpacing = 16;
    int beltOffsetY = 14;

    int beltX = 62;
    int beltLength = 144;
    int intakeX = 210;
    int intakeLength = 36;

    int leftTransferX = 45;
    int rightTransferX = 195;
    int leftCatchX = 65;
    int rightCatchX = 175;
    int leftFailX = 15;
    int rightFailX = 240;
    int catchToleranceY = 3;
    int characterOffsetY = 2;

    int spawnX = 230;
    int spawnZoneX = 210;

    int stepX = 10;
    int basePeriod = 9;
    int fallStep = 5;
    int liftShiftX = 10;
    StairGap gap{};

    int marioX = 212;
    int luigiX = 38;

    int truckOriginX = 0;
    int truckOffsetY = 6;
    int truckOffscreenX = -50;

    [[nodiscard]] static LevelLayout ForBelts(int belts);

    [[nodiscard]] int LastLane() const { return lanes - 1; }
    [[nodiscard]] bool IsValidLane(int lane) const { return lane >= 0 && lane < lanes; }
    [[nodiscard]] int LaneY(int lane) const;
    [[nodiscard]] int BeltY(int lane) const { return LaneY(lane) + beltOffsetY; }
    [[nodiscard]] int FloorY() const { return laneBaseY; }
    [[nodiscard]] static BeltDirection LaneDirection(int lane);
    [[nodiscard]] static Side ReceivingSide(int lane);

    [[nodiscard]] int FloorCount(Side side) const;
    [[nodiscard]] int ServedLane(Side side, int floor) const;
    [[nodiscard]] int CharacterX(Side side) const { return side == Side::Left ? luigiX : marioX; }
    [[nodiscard]] int CharacterY(Side side, int floor) const;
    [[nodiscard]] int DeliveryFloor() const { return FloorCount(Side::Left) - 1; }

    [[nodiscard]] int TruckY() const { return LaneY(LastLane()) + truckOffsetY; }

    /// Frames between horizontal steps for a lane moving at `speed` times the base pace.
    [[nodiscard]] int TickPeriod(float speed) const;

    [[nodiscard]] bool InTransferZone(int x, BeltDirection direction) const;
    [[nodiscard]] bool InCatchZone(int x, Side side) const;
    [[nodiscard]] bool PastFailEdge(int x) const { return x < leftFailX || x > rightFailX; }
};
} // namespace game::gameplay
