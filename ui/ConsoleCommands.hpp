#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace engine::core
{
class EventBus;
}

namespace engine::platform
{
class ActionBindings;
}

namespace game::gameplay
{
class Game;
}

namespace ui
{
struct ConsoleContext
{
    game::gameplay::Game* game = nullptr;
    const engine::core::EventBus* eventBus = nullptr;
    const engine::platform::ActionBindings* bindings = nullptr;

    bool* showDebugHud = nullptr;

    std::function<void()> toggleFullscreen;
    std::function<void(int)> setScale;
    std::function<void()> requestQuit;
};

/// Command registry and scroll-back behind the developer console. Independent of ImGui.
class ConsoleCommands
{
public:
    struct CommandInfo
    {
        std::string usage;
        std::string description;
        std::string category;
    };

    using CommandHandler = std::function<void(const std::vector<std::string>&, const ConsoleContext&)>;

    ConsoleCommands();

    void Execute(const std::string& commandLine, const ConsoleContext& context);

    void AddLog(const std::string& text);
    void ClearLog() { m_items.clear(); }
    void PrintHelp();

    [[nodiscard]] const std::vector<std::string>& Items() const { return m_items; }
    [[nodiscard]] const std::vector<std::string>& History() const { return m_history; }
    [[nodiscard]] const std::vector<CommandInfo>& Commands() const { return m_commandInfos; }
    [[nodiscard]] std::vector<CommandInfo> BuildHints(const std::string& inputText) const;
    [[nodiscard]] std::vector<std::string> CompletionCandidates(const std::string& word) const;

    /// Set whenever a log line is appended; the console clears it after scrolling.
    bool scrollToBottom = false;

    [[nodiscard]] static std::vector<std::string> Tokenize(const std::string& text);

private:
    void RegisterCommand(const std::string& usage, const std::string& description, CommandHandler handler);
    void RegisterDefaultCommands();

    std::vector<std::string> m_items;
    std::vector<std::string> m_history;
    std::unordered_map<std::string, CommandHandler> m_commandRegistry;
    std::vector<CommandInfo> m_commandInfos;
};
} // namespace ui
