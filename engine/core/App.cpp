#include "engine/core/App.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>

#include <glad/glad.h>
#include <GLFW/glfw3.h>
#include <nlohmann/json.hpp>

namespace engine::core
{
namespace
{
using json = nlohmann::json;

constexpr const char* kBuildId = "belt-bros-0.1";

const std::filesystem::path kConfigDir = "config";
} // namespace

bool App::Run()
{
    std::cout << "Belt Bros - Build: " << kBuildId << "\n";

    (void)LoadControlsConfig();
    (void)LoadGraphicsConfig();
    (void)LoadGameplayConfig();

    m_windowSettings.scale = m_graphicsApplied.scale;
    m_windowSettings.fullscreen = m_graphicsApplied.fullscreen;
    m_windowSettings.vsync = m_graphicsApplied.vsync;
    m_windowSettings.fpsLimit = m_graphicsApplied.fpsLimit;
    m_windowSettings.title = "Belt Bros";

    m_vsyncEnabled = m_graphicsApplied.vsync;
    m_fpsLimit = m_graphicsApplied.fpsLimit;

    if (!m_window.Initialize(m_windowSettings))
    {
        return false;
    }

    if (!gladLoadGL(reinterpret_cast<GLADloadfunc>(glfwGetProcAddress)))
    {
        std::cerr << "Failed to initialize GLAD.\n";
        m_window.Shutdown();
        return false;
    }

    const unsigned char* glVersion = glGetString(GL_VERSION);
    std::cout << "OpenGL version: " << (glVersion != nullptr ? reinterpret_cast<const char*>(glVersion) : "unknown") << "\n";

    if (!m_renderer.Initialize(
            m_window.FramebufferWidth(),
            m_window.FramebufferHeight(),
            m_windowSettings.logicalWidth,
            m_windowSettings.logicalHeight))
    {
        std::cerr << "Failed to initialize renderer.\n";
        m_window.Shutdown();
        return false;
    }

    if (!m_console.Initialize(m_window))
    {
        std::cerr << "Warning: failed to initialize developer console.\n";
    }

    m_window.SetResizeCallback([this](int width, int height) {
        m_renderer.SetViewport(width, height);
    });

    m_eventBus.Subscribe(EventBus::kAnyEvent, [](const Event& event) {
        std::cout << "[Game] " << event.ToString() << "\n";
    });

    m_game = std::make_unique<game::gameplay::Game>(m_gameplayTuning, &m_eventBus);

    ::ui::ConsoleContext consoleContext;
    consoleContext.game = m_game.get();
    consoleContext.eventBus = &m_eventBus;
    consoleContext.bindings = &m_actionBindings;
    consoleContext.showDebugHud = &m_showDebugHud;
    consoleContext.toggleFullscreen = [this]() { ToggleFullscreen(); };
    consoleContext.setScale = [this](int scale) { SetWindowScale(scale); };
    consoleContext.requestQuit = [this]() { m_game->RequestQuit(); };

    double lastFrameTime = glfwGetTime();
    double fpsAccumulator = 0.0;
    int fpsFrames = 0;
    float currentFps = 0.0F;

    while (!m_window.ShouldClose() && !m_game->QuitRequested())
    {
        const double frameStart = glfwGetTime();

        m_window.PollEvents();
        m_input.Update(m_window.NativeHandle());

        if (m_actionBindings.IsPressed(m_input, platform::InputAction::ToggleConsole))
        {
            m_console.Toggle();
        }

        const bool gameKeysEnabled = !m_console.WantsKeyboardCapture();
        if (gameKeysEnabled && m_actionBindings.IsPressed(m_input, platform::InputAction::ToggleDebugHud))
        {
            m_showDebugHud = !m_showDebugHud;
        }
        if (gameKeysEnabled && m_actionBindings.IsPressed(m_input, platform::InputAction::ToggleFullscreen))
        {
            ToggleFullscreen();
        }

        AccumulateCommands(gameKeysEnabled);

        m_time.BeginFrame(glfwGetTime());
        while (m_time.ShouldRunFixedStep())
        {
            m_game->Update(m_pendingCommands);
            m_pendingCommands = game::gameplay::FrameCommands{};
            m_eventBus.DispatchQueued();

            m_time.ConsumeFixedStep();
        }

        m_renderer.BeginFrame(render::PaletteColor::Navy, render::PaletteColor::Black);
        m_screenRenderer.Draw(m_renderer, *m_game);
        m_renderer.EndFrame();

        m_console.BeginFrame();
        m_console.Render(consoleContext, currentFps);

        m_window.SwapBuffers();

        const double now = glfwGetTime();
        const double frameDelta = now - lastFrameTime;
        lastFrameTime = now;
        fpsAccumulator += frameDelta;
        ++fpsFrames;
        if (fpsAccumulator >= 0.25)
        {
            currentFps = static_cast<float>(static_cast<double>(fpsFrames) / fpsAccumulator);
            fpsAccumulator = 0.0;
            fpsFrames = 0;
        }

        if (!m_vsyncEnabled && m_fpsLimit > 0)
        {
            const double targetSeconds = 1.0 / static_cast<double>(m_fpsLimit);
            double elapsed = glfwGetTime() - frameStart;

            if (elapsed < targetSeconds)
            {
                const double sleepThreshold = 0.002;
                const double remaining = targetSeconds - elapsed;
                if (remaining > sleepThreshold)
                {
                    std::this_thread::sleep_for(std::chrono::duration<double>(remaining - sleepThreshold));
                }

                while ((elapsed = glfwGetTime() - frameStart) < targetSeconds)
                {
                }
            }
        }
    }

    std::cout << "[Game] Final score: " << m_game->Score() << "\n";
    Shutdown();
    return true;
}

void App::AccumulateCommands(bool gameKeysEnabled)
{
    if (!gameKeysEnabled)
    {
        return;
    }

    using platform::InputAction;
    game::gameplay::FrameCommands& commands = m_pendingCommands;
    const auto pressed = [this](InputAction action) { return m_actionBindings.IsPressed(m_input, action); };

    commands.marioUp = commands.marioUp || pressed(InputAction::MarioUp);
    commands.marioDown = commands.marioDown || pressed(InputAction::MarioDown);
    commands.luigiUp = commands.luigiUp || pressed(InputAction::LuigiUp);
    commands.luigiDown = commands.luigiDown || pressed(InputAction::LuigiDown);
    commands.restart = commands.restart || pressed(InputAction::Restart);
    commands.backToMenu = commands.backToMenu || pressed(InputAction::BackToMenu);
    commands.quit = commands.quit || pressed(InputAction::Quit);

    if (pressed(InputAction::SelectEasy))
    {
        commands.selectDifficulty = game::gameplay::DifficultyId::Easy;
    }
    else if (pressed(InputAction::SelectMedium))
    {
        commands.selectDifficulty = game::gameplay::DifficultyId::Medium;
    }
    else if (pressed(InputAction::SelectExtreme))
    {
        commands.selectDifficulty = game::gameplay::DifficultyId::Extreme;
    }
    else if (pressed(InputAction::SelectCrazy))
    {
        commands.selectDifficulty = game::gameplay::DifficultyId::Crazy;
    }
}

void App::ToggleFullscreen()
{
    m_window.ToggleFullscreen();
    m_renderer.SetViewport(m_window.FramebufferWidth(), m_window.FramebufferHeight());
    m_graphicsApplied.fullscreen = m_window.IsFullscreen();
    if (!SaveGraphicsConfig())
    {
        std::cerr << "[Config] Failed to save graphics config.\n";
    }
}

void App::SetWindowScale(int scale)
{
    m_window.SetScale(scale);
    m_graphicsApplied.scale = m_window.Scale();
    if (!SaveGraphicsConfig())
    {
        std::cerr << "[Config] Failed to save graphics config.\n";
    }
}

void App::Shutdown()
{
    m_console.Shutdown();
    m_renderer.Shutdown();
    m_window.Shutdown();
}

bool App::LoadControlsConfig()
{
    m_actionBindings.ResetDefaults();

    std::filesystem::create_directories(kConfigDir);
    const std::filesystem::path path = kConfigDir / "controls.json";
    if (!std::filesystem::exists(path))
    {
        return SaveControlsConfig();
    }

    std::string error;
    if (!m_actionBindings.LoadFromJsonFile(path.string(), &error))
    {
        std::cerr << "[Config] " << error << ". Using default controls.\n";
        m_actionBindings.ResetDefaults();
        return SaveControlsConfig();
    }
    return true;
}

bool App::SaveControlsConfig() const
{
    std::string error;
    if (!m_actionBindings.SaveToJsonFile((kConfigDir / "controls.json").string(), &error))
    {
        std::cerr << "[Config] " << error << "\n";
        return false;
    }
    return true;
}

bool App::LoadGraphicsConfig()
{
    m_graphicsApplied = GraphicsSettings{};

    std::filesystem::create_directories(kConfigDir);
    const std::filesystem::path path = kConfigDir / "graphics.json";
    if (!std::filesystem::exists(path))
    {
        return SaveGraphicsConfig();
    }

    std::ifstream stream(path);
    if (!stream.is_open())
    {
        std::cerr << "[Config] Failed to open graphics config.\n";
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception&)
    {
        std::cerr << "[Config] Invalid graphics JSON. Using defaults.\n";
        return SaveGraphicsConfig();
    }

    if (root.contains("scale") && root["scale"].is_number_integer())
    {
        m_graphicsApplied.scale = root["scale"].get<int>();
    }
    if (root.contains("fullscreen") && root["fullscreen"].is_boolean())
    {
        m_graphicsApplied.fullscreen = root["fullscreen"].get<bool>();
    }
    if (root.contains("vsync") && root["vsync"].is_boolean())
    {
        m_graphicsApplied.vsync = root["vsync"].get<bool>();
    }
    if (root.contains("fps_limit") && root["fps_limit"].is_number_integer())
    {
        m_graphicsApplied.fpsLimit = root["fps_limit"].get<int>();
    }

    m_graphicsApplied.scale = std::clamp(m_graphicsApplied.scale, 1, 8);
    m_graphicsApplied.fpsLimit = std::max(0, m_graphicsApplied.fpsLimit);
    return true;
}

bool App::SaveGraphicsConfig() const
{
    std::filesystem::create_directories(kConfigDir);
    const std::filesystem::path path = kConfigDir / "graphics.json";

    json root;
    root["asset_version"] = m_graphicsApplied.assetVersion;
    root["scale"] = m_graphicsApplied.scale;
    root["fullscreen"] = m_graphicsApplied.fullscreen;
    root["vsync"] = m_graphicsApplied.vsync;
    root["fps_limit"] = m_graphicsApplied.fpsLimit;

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        return false;
    }
    stream << root.dump(2) << "\n";
    return true;
}

bool App::LoadGameplayConfig()
{
    std::string error;
    if (!m_gameplayTuning.LoadFromFile((kConfigDir / "gameplay.json").string(), &error))
    {
        std::cerr << "[Config] " << error << "\n";
        return false;
    }
    std::cout << "[Config] Gameplay: miss limit " << m_gameplayTuning.missLimit << ", truck capacity "
              << m_gameplayTuning.truckCapacity << "\n";
    return true;
}
} // namespace engine::core
