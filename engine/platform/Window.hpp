#pragma once

#include <functional>
#include <string>

struct GLFWwindow;

namespace engine::platform
{
struct WindowSettings
{
    int logicalWidth = 256;
    int logicalHeight = 192;
    int scale = 3;
    bool fullscreen = false;
    bool vsync = true;
    int fpsLimit = 60;
    std::string title = "Belt Bros";
};

/// Desktop window sized as an integer multiple of the logical canvas.
class Window
{
public:
    Window() = default;
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    bool Initialize(const WindowSettings& settings);
    void Shutdown();

    void PollEvents() const;
    void SwapBuffers() const;

    [[nodiscard]] bool ShouldClose() const;

    [[nodiscard]] GLFWwindow* NativeHandle() const { return m_window; }

    void SetVSync(bool enabled) const;
    void SetScale(int scale);
    void ToggleFullscreen();

    [[nodiscard]] int FramebufferWidth() const { return m_fbWidth; }
    [[nodiscard]] int FramebufferHeight() const { return m_fbHeight; }
    [[nodiscard]] int Scale() const { return m_scale; }
    [[nodiscard]] bool IsFullscreen() const { return m_fullscreen; }

    void SetResizeCallback(std::function<void(int, int)> callback);

private:
    static void FramebufferResizeCallback(GLFWwindow* window, int width, int height);

    GLFWwindow* m_window = nullptr;
    std::function<void(int, int)> m_resizeCallback;

    int m_logicalWidth = 256;
    int m_logicalHeight = 192;
    int m_scale = 3;

    int m_windowedX = 100;
    int m_windowedY = 100;
    int m_windowWidth = 768;
    int m_windowHeight = 576;
    int m_fbWidth = 768;
    int m_fbHeight = 576;

    bool m_fullscreen = false;
};
} // namespace engine::platform
