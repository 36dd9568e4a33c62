#include "game/ui/ScreenRenderer.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <sstream>

#include "engine/render/Renderer.hpp"
#include "game/gameplay/Game.hpp"

namespace game::ui
{
namespace
{
using engine::render::PaletteColor;

constexpr int kPackageSize = 8;
constexpr int kBeltThickness = 3;
constexpr int kCharacterWidth = 8;
constexpr int kCharacterHeight = 12;
constexpr int kTruckWidth = 40;
constexpr int kTruckHeight = 12;
constexpr int kBossWidth = 30;
constexpr int kBossHeight = 14;

std::string Upper(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return text;
}
} // namespace

void ScreenRenderer::Draw(engine::render::Renderer& renderer, const gameplay::Game& game) const
{
    switch (game.Phase())
    {
        case gameplay::GamePhase::Menu:
            DrawMenu(renderer);
            break;
        case gameplay::GamePhase::Playing:
            DrawPlayfield(renderer, game);
            break;
        case gameplay::GamePhase::GameOver:
            DrawPlayfield(renderer, game);
            DrawGameOver(renderer, game);
            break;
        default:
            break;
    }
}

std::string ScreenRenderer::HudStatusLine(const gameplay::Game& game)
{
    std::ostringstream oss;
    oss << Upper(game.GetDifficulty().name) << "  SCORE " << game.Score() << "  MISS " << game.Failures() << "/"
        << game.Tuning().missLimit;
    return oss.str();
}

std::string ScreenRenderer::HudProgressLine(const gameplay::Game& game)
{
    std::ostringstream oss;
    oss << "TRUCKS " << game.GetTruck().Deliveries() << "  PKGS " << game.Packages().size() << "/" << game.MaxPackages();
    if (game.BeltsResting())
    {
        oss << "  REST";
    }
    return oss.str();
}

void ScreenRenderer::DrawMenu(engine::render::Renderer& renderer) const
{
    const int centerX = renderer.LogicalWidth() / 2;
    renderer.DrawTextCentered(centerX, 24, "BELT BROS", PaletteColor::Red, 3);
    renderer.DrawTextCentered(centerX, 48, "SELECT DIFFICULTY", PaletteColor::White);

    int y = 66;
    int index = 1;
    for (const gameplay::Difficulty& difficulty : gameplay::Difficulty::Presets())
    {
        std::ostringstream line;
        line << index << "  " << Upper(difficulty.name) << "  " << difficulty.belts << " BELTS";
        if (difficulty.invertControls)
        {
            line << "  INVERTED";
        }
        renderer.DrawText(64, y, line.str(), PaletteColor::Yellow);
        y += 10;
        ++index;
    }

    renderer.DrawTextCentered(centerX, 122, "UP/DOWN: MARIO   W/S: LUIGI", PaletteColor::LightBlue);
    renderer.DrawTextCentered(centerX, 132, "Q: QUIT", PaletteColor::Gray);
    renderer.DrawTextCentered(centerX, 172, "CATCH EVERY PACKAGE. FILL THE TRUCK.", PaletteColor::Peach);
}

void ScreenRenderer::DrawPlayfield(engine::render::Renderer& renderer, const gameplay::Game& game) const
{
    DrawBelts(renderer, game);
    DrawTruck(renderer, game);
    DrawPackages(renderer, game);
    DrawCharacter(renderer, game.Mario(), true);
    DrawCharacter(renderer, game.Luigi(), false);
    DrawBoss(renderer, game);
    DrawHud(renderer, game);
}

void ScreenRenderer::DrawBelts(engine::render::Renderer& renderer, const gameplay::Game& game) const
{
    const bool resting = game.BeltsResting();
    for (const gameplay::Conveyor& conveyor : game.Conveyors())
    {
        const PaletteColor beltColor = conveyor.IsIntake() ? PaletteColor::Brown : PaletteColor::Gray;
        renderer.DrawRect(conveyor.X(), conveyor.Y(), conveyor.Length(), kBeltThickness, beltColor);

        // Rollers drift with the belt so speed differences are visible.
        const int period = std::max(1, conveyor.TickPeriod());
        const int phase = resting ? 0 : static_cast<int>((game.Frame() / static_cast<std::uint64_t>(period)) % 8U);
        const int shift = conveyor.Direction() == gameplay::BeltDirection::Left ? 8 - phase : phase;
        for (int offset = shift % 8; offset < conveyor.Length(); offset += 8)
        {
            renderer.DrawRect(conveyor.X() + offset, conveyor.Y() + 1, 1, 1, PaletteColor::Navy);
        }
    }

    // Floors the characters stand on.
    const gameplay::LevelLayout& layout = game.Layout();
    for (int floor = 0; floor < layout.FloorCount(gameplay::Side::Left); ++floor)
    {
        const int y = layout.CharacterY(gameplay::Side::Left, floor) + 2 + kCharacterHeight;
        renderer.DrawRect(layout.luigiX - 8, y, 16, 2, PaletteColor::DarkBlue);
    }
    for (int floor = 0; floor < layout.FloorCount(gameplay::Side::Right); ++floor)
    {
        const int y = layout.CharacterY(gameplay::Side::Right, floor) + 2 + kCharacterHeight;
        renderer.DrawRect(layout.marioX - 8, y, 16, 2, PaletteColor::DarkBlue);
    }
}

void ScreenRenderer::DrawPackages(engine::render::Renderer& renderer, const gameplay::Game& game) const
{
    for (const gameplay::Package& package : game.Packages())
    {
        const int x = package.X() - kPackageSize / 2;
        const int y = package.Y() + 14 - kPackageSize;
        const bool falling = package.State() == gameplay::PackageState::Falling;
        renderer.DrawRect(x, y, kPackageSize, kPackageSize, falling ? PaletteColor::Pink : PaletteColor::Peach);
        renderer.DrawRectOutline(x, y, kPackageSize, kPackageSize, PaletteColor::Brown);
        // Marker in the colour of whoever holds it.
        if (const std::optional<gameplay::Side> carrier = package.Carrier())
        {
            const PaletteColor marker = *carrier == gameplay::Side::Right ? PaletteColor::Red : PaletteColor::Green;
            renderer.DrawRect(x + 3, y - 2, 2, 2, marker);
        }
    }
}

void ScreenRenderer::DrawCharacter(engine::render::Renderer& renderer, const gameplay::Character& character, bool isMario) const
{
    const int x = character.X() - kCharacterWidth / 2;
    const int y = character.Y() + 2;
    const PaletteColor body = isMario ? PaletteColor::Red : PaletteColor::Green;

    renderer.DrawRect(x + 1, y, kCharacterWidth - 2, 3, body);
    renderer.DrawRect(x + 2, y + 3, kCharacterWidth - 4, 3, PaletteColor::Peach);
    renderer.DrawRect(x, y + 6, kCharacterWidth, 4, PaletteColor::Blue);
    renderer.DrawRect(x + 1, y + 10, 2, 2, PaletteColor::Brown);
    renderer.DrawRect(x + kCharacterWidth - 3, y + 10, 2, 2, PaletteColor::Brown);

    // Arms go up while holding or just after a catch.
    const bool armsUp = character.State() == gameplay::CharacterState::Prepared || character.CatchPoseFrames() > 0;
    const int armY = armsUp ? y - 2 : y + 6;
    renderer.DrawRect(x - 2, armY, 2, 3, PaletteColor::Peach);
    renderer.DrawRect(x + kCharacterWidth, armY, 2, 3, PaletteColor::Peach);
}

void ScreenRenderer::DrawTruck(engine::render::Renderer& renderer, const gameplay::Game& game) const
{
    const gameplay::Truck& truck = game.GetTruck();
    const int x = truck.X();
    const int y = truck.Y();

    renderer.DrawRect(x, y, kTruckWidth, kTruckHeight, PaletteColor::Blue);
    const int fill = truck.Capacity() > 0 ? (kTruckWidth * truck.Load()) / truck.Capacity() : 0;
    renderer.DrawRect(x, y, fill, kTruckHeight, PaletteColor::Brown);
    renderer.DrawRect(x + 4, y + kTruckHeight, 6, 3, PaletteColor::Gray);
    renderer.DrawRect(x + kTruckWidth - 10, y + kTruckHeight, 6, 3, PaletteColor::Gray);

    std::ostringstream label;
    label << truck.Load() << "/" << truck.Capacity();
    renderer.DrawText(x + 1, y - 7, label.str(), PaletteColor::White);
}

void ScreenRenderer::DrawBoss(engine::render::Renderer& renderer, const gameplay::Game& game) const
{
    const gameplay::BossAlert& boss = game.Boss();
    if (!boss.Active())
    {
        return;
    }

    int x = (renderer.LogicalWidth() - kBossWidth) / 2;
    if (boss.side.has_value())
    {
        x = *boss.side == gameplay::Side::Left ? 2 : renderer.LogicalWidth() - kBossWidth - 2;
    }
    const int y = game.Layout().FloorY() + 20;

    renderer.DrawRect(x, y, kBossWidth, kBossHeight, PaletteColor::Purple);
    renderer.DrawText(x + 5, y + 5, "BOSS!", PaletteColor::White);
}

void ScreenRenderer::DrawHud(engine::render::Renderer& renderer, const gameplay::Game& game) const
{
    renderer.DrawText(2, 2, HudStatusLine(game), PaletteColor::White);
    renderer.DrawText(2, 9, HudProgressLine(game), PaletteColor::LightBlue);
}

void ScreenRenderer::DrawGameOver(engine::render::Renderer& renderer, const gameplay::Game& game) const
{
    const int width = renderer.LogicalWidth() - 80;
    renderer.DrawRect(40, 70, width, 50, PaletteColor::Navy);
    renderer.DrawRectOutline(40, 70, width, 50, PaletteColor::White);

    const int centerX = renderer.LogicalWidth() / 2;
    renderer.DrawTextCentered(centerX, 76, "GAME OVER", PaletteColor::Red, 2);
    renderer.DrawTextCentered(centerX, 94, "SCORE " + std::to_string(game.Score()), PaletteColor::Yellow);
    renderer.DrawTextCentered(centerX, 106, "R RESTART  M MENU  Q QUIT", PaletteColor::White);
}
} // namespace game::ui
