#pragma once

#include <array>

struct GLFWwindow;

namespace engine::platform
{
/// Keyboard state with press/release edges between consecutive updates.
class Input
{
public:
    void Update(GLFWwindow* window);

    /// Starts a new sample without touching GLFW; follow with SetKeyState for each held key.
    void BeginSample();
    void SetKeyState(int key, bool down);

    [[nodiscard]] bool IsKeyDown(int key) const;
    [[nodiscard]] bool IsKeyPressed(int key) const;
    [[nodiscard]] bool IsKeyReleased(int key) const;

private:
    static constexpr int kMaxKeys = 512;

    std::array<unsigned char, kMaxKeys> m_currentKeys{};
    std::array<unsigned char, kMaxKeys> m_previousKeys{};
};
} // namespace engine::platform
