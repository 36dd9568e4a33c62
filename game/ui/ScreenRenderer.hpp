#pragma once

#include <string>

namespace engine::render
{
class Renderer;
}

namespace game::gameplay
{
class Game;
class Character;
}

namespace game::ui
{
/// Draws the menu, the playfield, the HUD and the game over panel from the game state.
class ScreenRenderer
{
public:
    void Draw(engine::render::Renderer& renderer, const gameplay::Game& game) const;

    [[nodiscard]] static std::string HudStatusLine(const gameplay::Game& game);
    [[nodiscard]] static std::string HudProgressLine(const gameplay::Game& game);

private:
    void DrawMenu(engine::render::Renderer& renderer) const;
    void DrawPlayfield(engine::render::Renderer& renderer, const gameplay::Game& game) const;
    void DrawBelts(engine::render::Renderer& renderer, const gameplay::Game& game) const;
    void DrawPackages(engine::render::Renderer& renderer, const gameplay::Game& game) const;
    void DrawCharacter(engine::render::Renderer& renderer, const gameplay::Character& character, bool isMario) const;
    void DrawTruck(engine::render::Renderer& renderer, const gameplay::Game& game) const;
    void DrawBoss(engine::render::Renderer& renderer, const gameplay::Game& game) const;
    void DrawHud(engine::render::Renderer& renderer, const gameplay::Game& game) const;
    void DrawGameOver(engine::render::Renderer& renderer, const gameplay::Game& game) const;
};
} // namespace game::ui
