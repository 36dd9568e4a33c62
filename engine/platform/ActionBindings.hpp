#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace engine::platform
{
class Input;

enum class InputAction : std::size_t
{
    MarioUp = 0,
    MarioDown,
    LuigiUp,
    LuigiDown,
    SelectEasy,
    SelectMedium,
    SelectExtreme,
    SelectCrazy,
    Restart,
    BackToMenu,
    Quit,
    ToggleConsole,
    ToggleDebugHud,
    ToggleFullscreen,
    Count
};

struct ActionBinding
{
    int primary = -1;
    int secondary = -1;
};

/// Maps game actions to GLFW key codes. Two slots per action.
class ActionBindings
{
public:
    static constexpr int kUnbound = -1;

    ActionBindings();

    void ResetDefaults();

    [[nodiscard]] const ActionBinding& Get(InputAction action) const;
    void Set(InputAction action, const ActionBinding& binding);
    void SetCode(InputAction action, int slot, int code);
    [[nodiscard]] int GetCode(InputAction action, int slot) const;

    [[nodiscard]] bool IsDown(const Input& input, InputAction action) const;
    [[nodiscard]] bool IsPressed(const Input& input, InputAction action) const;

    [[nodiscard]] bool LoadFromJsonFile(const std::string& path, std::string* outError = nullptr);
    [[nodiscard]] bool SaveToJsonFile(const std::string& path, std::string* outError = nullptr) const;

    [[nodiscard]] static std::vector<InputAction> AllActions();
    [[nodiscard]] static const char* ActionName(InputAction action);
    [[nodiscard]] static const char* ActionLabel(InputAction action);
    [[nodiscard]] static std::string CodeToLabel(int code);

private:
    std::array<ActionBinding, static_cast<std::size_t>(InputAction::Count)> m_bindings{};
};
} // namespace engine::platform
