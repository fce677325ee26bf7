#pragma once

#include <functional>
#include <string>

struct GLFWwindow;
struct GLFWcursor;

namespace engine::platform
{
struct WindowSettings
{
    int width = 1280;
    int height = 720;
    bool fullscreen = false;
    bool vsync = true;
    std::string title = "Aberrant";
};

enum class CursorShape
{
    Arrow,
    Crosshair
};

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
    void SetShouldClose(bool shouldClose) const;

    [[nodiscard]] GLFWwindow* NativeHandle() const { return m_window; }

    void SetVSync(bool enabled) const;
    void SetCursorCaptured(bool captured);
    void SetCursorShape(CursorShape shape);

    [[nodiscard]] bool IsCursorCaptured() const { return m_cursorCaptured; }
    [[nodiscard]] CursorShape GetCursorShape() const { return m_cursorShape; }
    [[nodiscard]] bool IsFocused() const;
    [[nodiscard]] bool IsHovered() const;

    [[nodiscard]] int FramebufferWidth() const { return m_fbWidth; }
    [[nodiscard]] int FramebufferHeight() const { return m_fbHeight; }
    [[nodiscard]] int WindowWidth() const { return m_windowWidth; }
    [[nodiscard]] int WindowHeight() const { return m_windowHeight; }

    void SetResizeCallback(std::function<void(int, int)> callback);
    void SetFocusCallback(std::function<void(bool)> callback);

private:
    static Window* FromHandle(GLFWwindow* window);
    static void FramebufferResizeCallback(GLFWwindow* window, int width, int height);
    static void WindowSizeCallback(GLFWwindow* window, int width, int height);
    static void FocusCallback(GLFWwindow* window, int focused);

    GLFWwindow* m_window = nullptr;
    GLFWcursor* m_crosshairCursor = nullptr;
    std::function<void(int, int)> m_resizeCallback;
    std::function<void(bool)> m_focusCallback;

    int m_windowWidth = 1280;
    int m_windowHeight = 720;
    int m_fbWidth = 1280;
    int m_fbHeight = 720;

    bool m_cursorCaptured = false;
    CursorShape m_cursorShape = CursorShape::Arrow;
};
} // namespace engine::platform
