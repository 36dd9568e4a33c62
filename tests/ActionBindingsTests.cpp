#include <gtest/gtest.h>

#include <filesystem>
#include <initializer_list>
#include <fstream>
#include <string>

#include <GLFW/glfw3.h>

#include "engine/platform/ActionBindings.hpp"
#include "engine/platform/Input.hpp"

using engine::platform::ActionBinding;
using engine::platform::ActionBindings;
using engine::platform::Input;
using engine::platform::InputAction;

namespace
{
void Sample(Input& input, std::initializer_list<int> heldKeys)
{
    input.BeginSample();
    for (const int key : heldKeys)
    {
        input.SetKeyState(key, true);
    }
}
} // namespace

TEST(Input, PressIsReportedOnlyOnTheFirstSample)
{
    Input input;
    Sample(input, {GLFW_KEY_UP});
    EXPECT_TRUE(input.IsKeyDown(GLFW_KEY_UP));
    EXPECT_TRUE(input.IsKeyPressed(GLFW_KEY_UP));

    Sample(input, {GLFW_KEY_UP});
    EXPECT_TRUE(input.IsKeyDown(GLFW_KEY_UP));
    EXPECT_FALSE(input.IsKeyPressed(GLFW_KEY_UP));

    Sample(input, {});
    EXPECT_TRUE(input.IsKeyReleased(GLFW_KEY_UP));
    EXPECT_FALSE(input.IsKeyDown(GLFW_KEY_UP));
}

TEST(Input, OutOfRangeKeysAreIgnored)
{
    Input input;
    Sample(input, {-1, 4096});
    EXPECT_FALSE(input.IsKeyDown(-1));
    EXPECT_FALSE(input.IsKeyPressed(4096));
}

TEST(ActionBindings, DefaultsMatchTheArcadeKeys)
{
    const ActionBindings bindings;
    EXPECT_EQ(bindings.Get(InputAction::MarioUp).primary, GLFW_KEY_UP);
    EXPECT_EQ(bindings.Get(InputAction::LuigiDown).primary, GLFW_KEY_S);
    EXPECT_EQ(bindings.Get(InputAction::SelectCrazy).primary, GLFW_KEY_4);
    EXPECT_EQ(bindings.Get(InputAction::SelectCrazy).secondary, GLFW_KEY_KP_4);
    EXPECT_EQ(bindings.Get(InputAction::Quit).primary, GLFW_KEY_Q);
    EXPECT_EQ(bindings.Get(InputAction::Quit).secondary, ActionBindings::kUnbound);
}

TEST(ActionBindings, EitherSlotTriggersTheAction)
{
    const ActionBindings bindings;
    Input input;
    Sample(input, {GLFW_KEY_KP_2});
    EXPECT_TRUE(bindings.IsPressed(input, InputAction::SelectMedium));
    EXPECT_FALSE(bindings.IsPressed(input, InputAction::SelectEasy));

    Sample(input, {GLFW_KEY_KP_2});
    EXPECT_FALSE(bindings.IsPressed(input, InputAction::SelectMedium));
    EXPECT_TRUE(bindings.IsDown(input, InputAction::SelectMedium));
}

TEST(ActionBindings, JsonRoundTripKeepsRebinds)
{
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "beltbros_bindings" / "controls.json";
    std::filesystem::remove_all(path.parent_path());

    ActionBindings saved;
    saved.SetCode(InputAction::MarioUp, 1, GLFW_KEY_I);
    saved.SetCode(InputAction::Quit, 0, GLFW_KEY_ESCAPE);
    std::string error;
    ASSERT_TRUE(saved.SaveToJsonFile(path.string(), &error)) << error;

    ActionBindings loaded;
    ASSERT_TRUE(loaded.LoadFromJsonFile(path.string(), &error)) << error;
    EXPECT_EQ(loaded.GetCode(InputAction::MarioUp, 0), GLFW_KEY_UP);
    EXPECT_EQ(loaded.GetCode(InputAction::MarioUp, 1), GLFW_KEY_I);
    EXPECT_EQ(loaded.GetCode(InputAction::Quit, 0), GLFW_KEY_ESCAPE);

    std::filesystem::remove_all(path.parent_path());
}

TEST(ActionBindings, RejectsFilesWithoutBindings)
{
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "beltbros_bindings_bad.json";
    {
        std::ofstream stream(path);
        stream << R"({"asset_version": 1})";
    }

    ActionBindings bindings;
    std::string error;
    EXPECT_FALSE(bindings.LoadFromJsonFile(path.string(), &error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(bindings.LoadFromJsonFile((path.parent_path() / "beltbros_missing.json").string()));
    std::filesystem::remove(path);
}

TEST(ActionBindings, LabelsForDisplay)
{
    EXPECT_STREQ(ActionBindings::ActionName(InputAction::ToggleDebugHud), "ToggleDebugHUD");
    EXPECT_STREQ(ActionBindings::ActionLabel(InputAction::LuigiUp), "Luigi Up");
    EXPECT_EQ(ActionBindings::CodeToLabel(GLFW_KEY_GRAVE_ACCENT), "Tilde");
    EXPECT_EQ(ActionBindings::CodeToLabel(ActionBindings::kUnbound), "Unbound");
    EXPECT_EQ(ActionBindings::CodeToLabel(GLFW_KEY_Z), "Key(90)");
    EXPECT_EQ(ActionBindings::AllActions().size(), static_cast<std::size_t>(InputAction::Count));
}
