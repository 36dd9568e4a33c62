#pragma once

#include <memory>
#include <string>

#include "engine/core/EventBus.hpp"
#include "engine/core/Time.hpp"
#include "engine/platform/ActionBindings.hpp"
#include "engine/platform/Input.hpp"
#include "engine/platform/Window.hpp"
#include "engine/render/Renderer.hpp"
#include "game/gameplay/Game.hpp"
#include "game/gameplay/GameplayTuning.hpp"
#include "game/ui/ScreenRenderer.hpp"
#include "ui/DeveloperConsole.hpp"

namespace engine::core
{
class App
{
public:
    bool Run();

    struct GraphicsSettings
    {
        int assetVersion = 1;
        int scale = 3;
        bool fullscreen = false;
        bool vsync = true;
        int fpsLimit = 60;
    };

private:
    bool LoadControlsConfig();
    bool SaveControlsConfig() const;
    bool LoadGraphicsConfig();
    bool SaveGraphicsConfig() const;
    bool LoadGameplayConfig();

    /// Collects key edges seen since the last fixed tick so none are lost between ticks.
    void AccumulateCommands(bool gameKeysEnabled);
    void ToggleFullscreen();
    void SetWindowScale(int scale);
    void Shutdown();

    platform::WindowSettings m_windowSettings;
    platform::Window m_window;
    platform::Input m_input;
    platform::ActionBindings m_actionBindings;
    Time m_time{1.0 / 30.0};
    EventBus m_eventBus;
    render::Renderer m_renderer;
    game::ui::ScreenRenderer m_screenRenderer;
    ::ui::DeveloperConsole m_console;

    game::gameplay::GameplayTuning m_gameplayTuning;
    std::unique_ptr<game::gameplay::Game> m_game;
    game::gameplay::FrameCommands m_pendingCommands;

    GraphicsSettings m_graphicsApplied;
    bool m_vsyncEnabled = true;
    int m_fpsLimit = 60;
    bool m_showDebugHud = false;
};
} // namespace engine::core
