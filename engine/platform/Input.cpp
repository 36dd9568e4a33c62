#include "engine/platform/Input.hpp"

#include <GLFW/glfw3.h>

namespace engine::platform
{
void Input::Update(GLFWwindow* window)
{
    BeginSample();
    if (window == nullptr)
    {
        return;
    }

    // GLFW_KEY_SPACE is the lowest printable key code; below it glfwGetKey reports an invalid enum.
    for (int key = GLFW_KEY_SPACE; key < kMaxKeys && key <= GLFW_KEY_LAST; ++key)
    {
        SetKeyState(key, glfwGetKey(window, key) == GLFW_PRESS);
    }
}

void Input::BeginSample()
{
    m_previousKeys = m_currentKeys;
    m_currentKeys.fill(0);
}

void Input::SetKeyState(int key, bool down)
{
    if (key < 0 || key >= kMaxKeys)
    {
        return;
    }
    m_currentKeys[static_cast<size_t>(key)] = static_cast<unsigned char>(down);
}

bool Input::IsKeyDown(int key) const
{
    if (key < 0 || key >= kMaxKeys)
    {
        return false;
    }
    return m_currentKeys[static_cast<size_t>(key)] != 0;
}

bool Input::IsKeyPressed(int key) const
{
    if (key < 0 || key >= kMaxKeys)
    {
        return false;
    }
    const size_t index = static_cast<size_t>(key);
    return m_currentKeys[index] != 0 && m_previousKeys[index] == 0;
}

bool Input::IsKeyReleased(int key) const
{
    if (key < 0 || key >= kMaxKeys)
    {
        return false;
    }
    const size_t index = static_cast<size_t>(key);
    return m_currentKeys[index] == 0 && m_previousKeys[index] != 0;
}
} // namespace engine::platform
