#include <gtest/gtest.h>

#include "game/gameplay/Game.hpp"
#include "game/ui/ScreenRenderer.hpp"

using game::gameplay::DifficultyId;
using game::gameplay::Game;
using game::gameplay::GameplayTuning;
using game::ui::ScreenRenderer;

TEST(ScreenRendererHud, StatusLineShowsDifficultyScoreAndMisses)
{
    GameplayTuning tuning;
    tuning.seed = 3U;
    Game game(tuning);
    game.StartGame(DifficultyId::Extreme);
    game.SetFailures(2);
    EXPECT_EQ(ScreenRenderer::HudStatusLine(game), "EXTREME  SCORE 0  MISS 2/3");
}

TEST(ScreenRendererHud, ProgressLineFlagsRestingBelts)
{
    GameplayTuning tuning;
    tuning.seed = 3U;
    tuning.truckCapacity = 1;
    Game game(tuning);
    game.StartGame(DifficultyId::Easy);
    EXPECT_EQ(ScreenRenderer::HudProgressLine(game), "TRUCKS 0  PKGS 1/1");

    game::gameplay::FrameCommands up;
    up.luigiUp = true;
    game.Update(up);
    game.Update(up);
    game.MutablePackages().clear();
    game.MutablePackages().emplace_back(1U, 40, game.Layout().LastLane(), game.Layout());
    game.Update({});
    EXPECT_EQ(ScreenRenderer::HudProgressLine(game), "TRUCKS 1  PKGS 0/1  REST");
}
