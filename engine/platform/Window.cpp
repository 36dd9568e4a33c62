#include "engine/platform/Window.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include <GLFW/glfw3.h>

namespace engine::platform
{
namespace
{
constexpr int kMaxScale = 8;
}

Window::~Window()
{
    Shutdown();
}

bool Window::Initialize(const WindowSettings& settings)
{
    if (glfwInit() != GLFW_TRUE)
    {
        std::cerr << "Failed to initialize GLFW.\n";
        return false;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 5);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#if defined(__APPLE__)
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif

    m_logicalWidth = std::max(1, settings.logicalWidth);
    m_logicalHeight = std::max(1, settings.logicalHeight);
    m_scale = std::clamp(settings.scale, 1, kMaxScale);
    m_windowWidth = m_logicalWidth * m_scale;
    m_windowHeight = m_logicalHeight * m_scale;
    m_fullscreen = false;

    m_window = glfwCreateWindow(m_windowWidth, m_windowHeight, settings.title.c_str(), nullptr, nullptr);
    if (m_window == nullptr)
    {
        std::cerr << "Failed to create GLFW window.\n";
        glfwTerminate();
        return false;
    }

    glfwMakeContextCurrent(m_window);
    glfwSetWindowUserPointer(m_window, this);
    glfwSetFramebufferSizeCallback(m_window, FramebufferResizeCallback);
    glfwSetWindowSizeLimits(m_window, m_logicalWidth, m_logicalHeight, GLFW_DONT_CARE, GLFW_DONT_CARE);
    glfwGetFramebufferSize(m_window, &m_fbWidth, &m_fbHeight);

    SetVSync(settings.vsync);
    if (settings.fullscreen)
    {
        ToggleFullscreen();
    }
    return true;
}

void Window::Shutdown()
{
    if (m_window != nullptr)
    {
        glfwDestroyWindow(m_window);
        m_window = nullptr;
        glfwTerminate();
    }
}

void Window::PollEvents() const
{
    glfwPollEvents();
}

void Window::SwapBuffers() const
{
    if (m_window != nullptr)
    {
        glfwSwapBuffers(m_window);
    }
}

bool Window::ShouldClose() const
{
    return m_window == nullptr || glfwWindowShouldClose(m_window) == GLFW_TRUE;
}

void Window::SetVSync(bool enabled) const
{
    glfwSwapInterval(enabled ? 1 : 0);
}

void Window::SetScale(int scale)
{
    m_scale = std::clamp(scale, 1, kMaxScale);
    if (m_window == nullptr || m_fullscreen)
    {
        return;
    }

    m_windowWidth = m_logicalWidth * m_scale;
    m_windowHeight = m_logicalHeight * m_scale;
    glfwSetWindowSize(m_window, m_windowWidth, m_windowHeight);
}

void Window::ToggleFullscreen()
{
    if (m_window == nullptr)
    {
        return;
    }

    if (m_fullscreen)
    {
        m_windowWidth = m_logicalWidth * m_scale;
        m_windowHeight = m_logicalHeight * m_scale;
        glfwSetWindowMonitor(m_window, nullptr, m_windowedX, m_windowedY, m_windowWidth, m_windowHeight, 0);
        m_fullscreen = false;
        return;
    }

    GLFWmonitor* primaryMonitor = glfwGetPrimaryMonitor();
    const GLFWvidmode* primaryMode = glfwGetVideoMode(primaryMonitor);
    if (primaryMode == nullptr)
    {
        std::cerr << "Failed to query the primary monitor video mode.\n";
        return;
    }

    glfwGetWindowPos(m_window, &m_windowedX, &m_windowedY);
    glfwSetWindowMonitor(m_window, primaryMonitor, 0, 0, primaryMode->width, primaryMode->height, primaryMode->refreshRate);
    m_windowWidth = primaryMode->width;
    m_windowHeight = primaryMode->height;
    m_fullscreen = true;
}

void Window::SetResizeCallback(std::function<void(int, int)> callback)
{
    m_resizeCallback = std::move(callback);
}

void Window::FramebufferResizeCallback(GLFWwindow* window, int width, int height)
{
    Window* self = static_cast<Window*>(glfwGetWindowUserPointer(window));
    if (self == nullptr)
    {
        return;
    }

    self->m_fbWidth = width;
    self->m_fbHeight = height;
    if (self->m_resizeCallback)
    {
        self->m_resizeCallback(width, height);
    }
}
} // namespace engine::platform
