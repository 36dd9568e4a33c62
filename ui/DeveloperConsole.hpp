#pragma once

#include "ui/ConsoleCommands.hpp"

namespace engine::platform
{
class Window;
}

namespace ui
{
/// ImGui front end for ConsoleCommands plus the F1 debug HUD. A no-op without BUILD_WITH_IMGUI.
class DeveloperConsole
{
public:
    bool Initialize(engine::platform::Window& window);
    void Shutdown();

    void BeginFrame();
    void Render(const ConsoleContext& context, float fps);

    void Toggle();
    [[nodiscard]] bool IsOpen() const;
    [[nodiscard]] bool WantsKeyboardCapture() const;

    [[nodiscard]] ConsoleCommands& Commands() { return m_commands; }

private:
    ConsoleCommands m_commands;

#if BUILD_WITH_IMGUI
    struct Impl;
    Impl* m_impl = nullptr;
#endif
};
} // namespace ui
