#include "engine/platform/ActionBindings.hpp"

#include <filesystem>
#include <fstream>
#include <unordered_map>

#include <GLFW/glfw3.h>
#include <nlohmann/json.hpp>

#include "engine/platform/Input.hpp"

namespace engine::platform
{
namespace
{
using json = nlohmann::json;

const std::unordered_map<int, std::string> kCodeToText{
    {GLFW_KEY_UP, "Up"},
    {GLFW_KEY_DOWN, "Down"},
    {GLFW_KEY_W, "W"},
    {GLFW_KEY_S, "S"},
    {GLFW_KEY_1, "1"},
    {GLFW_KEY_2, "2"},
    {GLFW_KEY_3, "3"},
    {GLFW_KEY_4, "4"},
    {GLFW_KEY_KP_1, "Num1"},
    {GLFW_KEY_KP_2, "Num2"},
    {GLFW_KEY_KP_3, "Num3"},
    {GLFW_KEY_KP_4, "Num4"},
    {GLFW_KEY_R, "R"},
    {GLFW_KEY_M, "M"},
    {GLFW_KEY_Q, "Q"},
    {GLFW_KEY_ESCAPE, "Esc"},
    {GLFW_KEY_GRAVE_ACCENT, "Tilde"},
    {GLFW_KEY_F1, "F1"},
    {GLFW_KEY_F11, "F11"},
};

bool Matches(const Input& input, int code, bool pressed)
{
    if (code == ActionBindings::kUnbound)
    {
        return false;
    }
    return pressed ? input.IsKeyPressed(code) : input.IsKeyDown(code);
}
} // namespace

ActionBindings::ActionBindings()
{
    ResetDefaults();
}

void ActionBindings::ResetDefaults()
{
    for (ActionBinding& binding : m_bindings)
    {
        binding = ActionBinding{};
    }

    SetCode(InputAction::MarioUp, 0, GLFW_KEY_UP);
    SetCode(InputAction::MarioDown, 0, GLFW_KEY_DOWN);
    SetCode(InputAction::LuigiUp, 0, GLFW_KEY_W);
    SetCode(InputAction::LuigiDown, 0, GLFW_KEY_S);
    SetCode(InputAction::SelectEasy, 0, GLFW_KEY_1);
    SetCode(InputAction::SelectEasy, 1, GLFW_KEY_KP_1);
    SetCode(InputAction::SelectMedium, 0, GLFW_KEY_2);
    SetCode(InputAction::SelectMedium, 1, GLFW_KEY_KP_2);
    SetCode(InputAction::SelectExtreme, 0, GLFW_KEY_3);
    SetCode(InputAction::SelectExtreme, 1, GLFW_KEY_KP_3);
    SetCode(InputAction::SelectCrazy, 0, GLFW_KEY_4);
    SetCode(InputAction::SelectCrazy, 1, GLFW_KEY_KP_4);
    SetCode(InputAction::Restart, 0, GLFW_KEY_R);
    SetCode(InputAction::BackToMenu, 0, GLFW_KEY_M);
    SetCode(InputAction::Quit, 0, GLFW_KEY_Q);
    SetCode(InputAction::ToggleConsole, 0, GLFW_KEY_GRAVE_ACCENT);
    SetCode(InputAction::ToggleDebugHud, 0, GLFW_KEY_F1);
    SetCode(InputAction::ToggleFullscreen, 0, GLFW_KEY_F11);
}

const ActionBinding& ActionBindings::Get(InputAction action) const
{
    return m_bindings[static_cast<std::size_t>(action)];
}

void ActionBindings::Set(InputAction action, const ActionBinding& binding)
{
    m_bindings[static_cast<std::size_t>(action)] = binding;
}

void ActionBindings::SetCode(InputAction action, int slot, int code)
{
    ActionBinding& binding = m_bindings[static_cast<std::size_t>(action)];
    if (slot <= 0)
    {
        binding.primary = code;
    }
    else
    {
        binding.secondary = code;
    }
}

int ActionBindings::GetCode(InputAction action, int slot) const
{
    const ActionBinding& binding = m_bindings[static_cast<std::size_t>(action)];
    return slot <= 0 ? binding.primary : binding.secondary;
}

bool ActionBindings::IsDown(const Input& input, InputAction action) const
{
    const ActionBinding& binding = Get(action);
    return Matches(input, binding.primary, false) || Matches(input, binding.secondary, false);
}

bool ActionBindings::IsPressed(const Input& input, InputAction action) const
{
    const ActionBinding& binding = Get(action);
    return Matches(input, binding.primary, true) || Matches(input, binding.secondary, true);
}

bool ActionBindings::LoadFromJsonFile(const std::string& path, std::string* outError)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Cannot open controls file: " + path;
        }
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& ex)
    {
        if (outError != nullptr)
        {
            *outError = std::string{"Invalid controls JSON: "} + ex.what();
        }
        return false;
    }

    if (!root.contains("bindings") || !root["bindings"].is_object())
    {
        if (outError != nullptr)
        {
            *outError = "Missing controls.bindings object";
        }
        return false;
    }

    for (InputAction action : AllActions())
    {
        const char* actionName = ActionName(action);
        if (!root["bindings"].contains(actionName))
        {
            continue;
        }
        const json& node = root["bindings"][actionName];
        if (!node.is_object())
        {
            continue;
        }
        ActionBinding binding = Get(action);
        if (node.contains("primary") && node["primary"].is_number_integer())
        {
            binding.primary = node["primary"].get<int>();
        }
        if (node.contains("secondary") && node["secondary"].is_number_integer())
        {
            binding.secondary = node["secondary"].get<int>();
        }
        Set(action, binding);
    }

    return true;
}

bool ActionBindings::SaveToJsonFile(const std::string& path, std::string* outError) const
{
    const std::filesystem::path filePath(path);
    if (filePath.has_parent_path())
    {
        std::filesystem::create_directories(filePath.parent_path());
    }

    json root;
    root["asset_version"] = 1;
    json bindings = json::object();
    for (InputAction action : AllActions())
    {
        const ActionBinding& binding = Get(action);
        bindings[ActionName(action)] = {
            {"primary", binding.primary},
            {"secondary", binding.secondary},
        };
    }
    root["bindings"] = std::move(bindings);

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Cannot write controls file: " + path;
        }
        return false;
    }

    stream << root.dump(2) << "\n";
    return true;
}

std::vector<InputAction> ActionBindings::AllActions()
{
    std::vector<InputAction> actions;
    actions.reserve(static_cast<std::size_t>(InputAction::Count));
    for (std::size_t i = 0; i < static_cast<std::size_t>(InputAction::Count); ++i)
    {
        actions.push_back(static_cast<InputAction>(i));
    }
    return actions;
}

const char* ActionBindings::ActionName(InputAction action)
{
    switch (action)
    {
        case InputAction::MarioUp: return "MarioUp";
        case InputAction::MarioDown: return "MarioDown";
        case InputAction::LuigiUp: return "LuigiUp";
        case InputAction::LuigiDown: return "LuigiDown";
        case InputAction::SelectEasy: return "SelectEasy";
        case InputAction::SelectMedium: return "SelectMedium";
        case InputAction::SelectExtreme: return "SelectExtreme";
        case InputAction::SelectCrazy: return "SelectCrazy";
        case InputAction::Restart: return "Restart";
        case InputAction::BackToMenu: return "BackToMenu";
        case InputAction::Quit: return "Quit";
        case InputAction::ToggleConsole: return "ToggleConsole";
        case InputAction::ToggleDebugHud: return "ToggleDebugHUD";
        case InputAction::ToggleFullscreen: return "ToggleFullscreen";
        default: return "Unknown";
    }
}

const char* ActionBindings::ActionLabel(InputAction action)
{
    switch (action)
    {
        case InputAction::MarioUp: return "Mario Up";
        case InputAction::MarioDown: return "Mario Down";
        case InputAction::LuigiUp: return "Luigi Up";
        case InputAction::LuigiDown: return "Luigi Down";
        case InputAction::SelectEasy: return "Select Easy";
        case InputAction::SelectMedium: return "Select Medium";
        case InputAction::SelectExtreme: return "Select Extreme";
        case InputAction::SelectCrazy: return "Select Crazy";
        case InputAction::Restart: return "Restart";
        case InputAction::BackToMenu: return "Back To Menu";
        case InputAction::Quit: return "Quit";
        case InputAction::ToggleConsole: return "Toggle Console";
        case InputAction::ToggleDebugHud: return "Toggle Debug HUD";
        case InputAction::ToggleFullscreen: return "Toggle Fullscreen";
        default: return "Unknown";
    }
}

std::string ActionBindings::CodeToLabel(int code)
{
    if (code == kUnbound)
    {
        return "Unbound";
    }

    if (const auto it = kCodeToText.find(code); it != kCodeToText.end())
    {
        return it->second;
    }

    return "Key(" + std::to_string(code) + ")";
}
} // namespace engine::platform
