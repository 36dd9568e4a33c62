#include "ui/ConsoleCommands.hpp"

#include <algorithm>
#include <exception>
#include <map>
#include <sstream>
#include <string>

#include "engine/core/EventBus.hpp"
#include "engine/platform/ActionBindings.hpp"
#include "game/gameplay/Game.hpp"

namespace ui
{
namespace
{
bool ParseInt(const std::string& token, int& outValue)
{
    try
    {
        std::size_t consumed = 0;
        const int value = std::stoi(token, &consumed);
        if (consumed != token.size())
        {
            return false;
        }
        outValue = value;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

bool ParseBoolToken(const std::string& token, bool& outValue)
{
    if (token == "on" || token == "true" || token == "1")
    {
        outValue = true;
        return true;
    }
    if (token == "off" || token == "false" || token == "0")
    {
        outValue = false;
        return true;
    }
    return false;
}

std::string CommandCategoryForUsage(const std::string& command)
{
    if (command == "help" || command == "quit")
    {
        return "General";
    }
    if (command == "difficulty" || command == "restart" || command == "menu")
    {
        return "Session";
    }
    if (command == "toggle_fullscreen" || command == "scale" || command == "debug_hud")
    {
        return "System";
    }
    return "Debug";
}

void AddLines(ConsoleCommands& console, const std::string& text)
{
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line))
    {
        console.AddLog(line);
    }
}
} // namespace

ConsoleCommands::ConsoleCommands()
{
    RegisterDefaultCommands();
}

std::vector<std::string> ConsoleCommands::Tokenize(const std::string& text)
{
    std::istringstream stream(text);
    std::vector<std::string> tokens;
    std::string token;
    while (stream >> token)
    {
        tokens.push_back(token);
    }
    return tokens;
}

void ConsoleCommands::AddLog(const std::string& text)
{
    m_items.push_back(text);
    scrollToBottom = true;
}

void ConsoleCommands::PrintHelp()
{
    AddLog("Available commands by category:");
    std::map<std::string, std::vector<CommandInfo>> grouped;
    for (const CommandInfo& info : m_commandInfos)
    {
        grouped[info.category].push_back(info);
    }

    for (auto& [category, commands] : grouped)
    {
        std::sort(commands.begin(), commands.end(), [](const CommandInfo& a, const CommandInfo& b) {
            return a.usage < b.usage;
        });
        AddLog("[" + category + "]");
        for (const CommandInfo& info : commands)
        {
            AddLog("  " + info.usage + " - " + info.description);
        }
    }
}

void ConsoleCommands::Execute(const std::string& commandLine, const ConsoleContext& context)
{
    AddLog("# " + commandLine);

    const std::vector<std::string> tokens = Tokenize(commandLine);
    if (tokens.empty())
    {
        return;
    }

    m_history.erase(std::remove(m_history.begin(), m_history.end(), commandLine), m_history.end());
    m_history.push_back(commandLine);

    const auto it = m_commandRegistry.find(tokens[0]);
    if (it == m_commandRegistry.end())
    {
        AddLog("Unknown command. Type `help`.");
        return;
    }

    it->second(tokens, context);
}

std::vector<ConsoleCommands::CommandInfo> ConsoleCommands::BuildHints(const std::string& inputText) const
{
    std::vector<CommandInfo> hints;
    const std::vector<std::string> inputTokens = Tokenize(inputText);
    const std::string prefix = inputTokens.empty() ? std::string{} : inputTokens.front();

    for (const CommandInfo& info : m_commandInfos)
    {
        if (prefix.empty() || info.usage.rfind(prefix, 0) == 0)
        {
            hints.push_back(info);
        }
    }
    std::sort(hints.begin(), hints.end(), [](const CommandInfo& a, const CommandInfo& b) {
        if (a.category == b.category)
        {
            return a.usage < b.usage;
        }
        return a.category < b.category;
    });
    return hints;
}

std::vector<std::string> ConsoleCommands::CompletionCandidates(const std::string& word) const
{
    std::vector<std::string> candidates;
    for (const CommandInfo& info : m_commandInfos)
    {
        const std::string command = Tokenize(info.usage).front();
        if (command.rfind(word, 0) == 0)
        {
            candidates.push_back(command);
        }
    }
    std::sort(candidates.begin(), candidates.end());
    return candidates;
}

void ConsoleCommands::RegisterCommand(const std::string& usage, const std::string& description, CommandHandler handler)
{
    const std::vector<std::string> tokens = Tokenize(usage);
    if (tokens.empty())
    {
        return;
    }

    m_commandInfos.push_back(CommandInfo{usage, description, CommandCategoryForUsage(tokens.front())});
    m_commandRegistry[tokens.front()] = std::move(handler);
}

void ConsoleCommands::RegisterDefaultCommands()
{
    RegisterCommand("help", "List available commands", [this](const std::vector<std::string>&, const ConsoleContext&) {
        PrintHelp();
    });

    RegisterCommand("difficulty easy|medium|extreme|crazy", "Start a new game", [this](const std::vector<std::string>& tokens, const ConsoleContext& context) {
        if (tokens.size() != 2 || context.game == nullptr)
        {
            AddLog("Usage: difficulty easy|medium|extreme|crazy");
            return;
        }

        const auto id = game::gameplay::Difficulty::FromName(tokens[1]);
        if (!id.has_value())
        {
            AddLog("Unknown difficulty: " + tokens[1]);
            return;
        }
        context.game->StartGame(*id);
        AddLog("Started " + context.game->GetDifficulty().name + ".");
    });

    RegisterCommand("restart", "Restart with the current difficulty", [this](const std::vector<std::string>&, const ConsoleContext& context) {
        if (context.game == nullptr)
        {
            return;
        }
        context.game->Restart();
        AddLog("Restarted " + context.game->GetDifficulty().name + ".");
    });

    RegisterCommand("menu", "Return to the main menu", [this](const std::vector<std::string>&, const ConsoleContext& context) {
        if (context.game == nullptr)
        {
            return;
        }
        context.game->BackToMenu();
        AddLog("Back to menu.");
    });

    RegisterCommand("spawn", "Spawn a package at the intake", [this](const std::vector<std::string>&, const ConsoleContext& context) {
        if (context.game == nullptr)
        {
            return;
        }
        if (context.game->ForceSpawn())
        {
            AddLog("Package spawned.");
        }
        else
        {
            AddLog("Cannot spawn: no game running or intake occupied.");
        }
    });

    RegisterCommand("set_failures 0", "Overwrite the failure count", [this](const std::vector<std::string>& tokens, const ConsoleContext& context) {
        int failures = 0;
        if (tokens.size() != 2 || context.game == nullptr || !ParseInt(tokens[1], failures) || failures < 0)
        {
            AddLog("Usage: set_failures <n>=0..");
            return;
        }
        context.game->SetFailures(failures);
        AddLog("Failures set to " + std::to_string(context.game->Failures()) + ".");
    });

    RegisterCommand("state_dump", "Print session, character and package state", [this](const std::vector<std::string>&, const ConsoleContext& context) {
        if (context.game == nullptr)
        {
            return;
        }
        AddLines(*this, context.game->DescribeState());
    });

    RegisterCommand("truck_dump", "Print truck state", [this](const std::vector<std::string>&, const ConsoleContext& context) {
        if (context.game == nullptr)
        {
            return;
        }
        AddLog(context.game->DescribeTruck());
    });

    RegisterCommand("events 20", "Print the most recent game events", [this](const std::vector<std::string>& tokens, const ConsoleContext& context) {
        if (context.eventBus == nullptr)
        {
            AddLog("No event bus attached.");
            return;
        }

        int count = 20;
        if (tokens.size() >= 2 && (!ParseInt(tokens[1], count) || count <= 0))
        {
            AddLog("Usage: events [count]");
            return;
        }

        const auto& history = context.eventBus->History();
        const std::size_t shown = std::min(history.size(), static_cast<std::size_t>(count));
        for (std::size_t i = history.size() - shown; i < history.size(); ++i)
        {
            AddLog(history[i].ToString());
        }
        if (shown == 0)
        {
            AddLog("No events yet.");
        }
    });

    RegisterCommand("bindings", "List key bindings", [this](const std::vector<std::string>&, const ConsoleContext& context) {
        if (context.bindings == nullptr)
        {
            return;
        }
        using engine::platform::ActionBindings;
        for (const auto action : ActionBindings::AllActions())
        {
            const auto& binding = context.bindings->Get(action);
            AddLog(
                std::string("  ") + ActionBindings::ActionLabel(action) + ": " + ActionBindings::CodeToLabel(binding.primary) + " / "
                + ActionBindings::CodeToLabel(binding.secondary)
            );
        }
    });

    RegisterCommand("debug_hud on|off", "Show or hide the debug HUD", [this](const std::vector<std::string>& tokens, const ConsoleContext& context) {
        bool enabled = true;
        if (tokens.size() != 2 || !ParseBoolToken(tokens[1], enabled) || context.showDebugHud == nullptr)
        {
            AddLog("Usage: debug_hud on|off");
            return;
        }
        *context.showDebugHud = enabled;
        AddLog(std::string("Debug HUD ") + (enabled ? "shown." : "hidden."));
    });

    RegisterCommand("toggle_fullscreen", "Toggle fullscreen", [this](const std::vector<std::string>&, const ConsoleContext& context) {
        if (context.toggleFullscreen)
        {
            context.toggleFullscreen();
            AddLog("Toggled fullscreen.");
        }
    });

    RegisterCommand("scale 3", "Set the window size to n times 256x192 (1-8)", [this](const std::vector<std::string>& tokens, const ConsoleContext& context) {
        int scale = 0;
        if (tokens.size() != 2 || !ParseInt(tokens[1], scale) || scale < 1 || scale > 8 || !context.setScale)
        {
            AddLog("Usage: scale <1..8>");
            return;
        }
        context.setScale(scale);
        AddLog("Window scale set to " + std::to_string(scale) + "x.");
    });

    RegisterCommand("quit", "Quit the game", [this](const std::vector<std::string>&, const ConsoleContext& context) {
        if (context.requestQuit)
        {
            context.requestQuit();
        }
        else if (context.game != nullptr)
        {
            context.game->RequestQuit();
        }
        AddLog("Quitting.");
    });
}
} // namespace ui
