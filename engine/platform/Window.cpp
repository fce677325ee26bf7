#include "engine/platform/Window.hpp"

#include <iostream>
#include <utility>

#include <GLFW/glfw3.h>

namespace engine::platform
{
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

    m_windowWidth = settings.width;
    m_windowHeight = settings.height;

    GLFWmonitor* monitor = settings.fullscreen ? glfwGetPrimaryMonitor() : nullptr;
    m_window = glfwCreateWindow(m_windowWidth, m_windowHeight, settings.title.c_str(), monitor, nullptr);

    if (m_window == nullptr)
    {
        std::cerr << "Failed to create GLFW window.\n";
        glfwTerminate();
        return false;
    }

    glfwMakeContextCurrent(m_window);
    glfwSetWindowUserPointer(m_window, this);
    glfwSetFramebufferSizeCallback(m_window, FramebufferResizeCallback);
    glfwSetWindowSizeCallback(m_window, WindowSizeCallback);
    glfwSetWindowFocusCallback(m_window, FocusCallback);
    glfwGetFramebufferSize(m_window, &m_fbWidth, &m_fbHeight);
    glfwGetWindowSize(m_window, &m_windowWidth, &m_windowHeight);

    m_crosshairCursor = glfwCreateStandardCursor(GLFW_CROSSHAIR_CURSOR);
    if (m_crosshairCursor == nullptr)
    {
        std::cerr << "[Window] Crosshair cursor unavailable, keeping the arrow.\n";
    }

    SetVSync(settings.vsync);
    return true;
}

void Window::Shutdown()
{
    if (m_crosshairCursor != nullptr)
    {
        glfwDestroyCursor(m_crosshairCursor);
        m_crosshairCursor = nullptr;
    }
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

void Window::SetShouldClose(bool shouldClose) const
{
    if (m_window != nullptr)
    {
        glfwSetWindowShouldClose(m_window, shouldClose ? GLFW_TRUE : GLFW_FALSE);
    }
}

void Window::SetVSync(bool enabled) const
{
    glfwSwapInterval(enabled ? 1 : 0);
}

void Window::SetCursorCaptured(bool captured)
{
    m_cursorCaptured = captured;
    if (m_window == nullptr)
    {
        return;
    }

    glfwSetInputMode(m_window, GLFW_CURSOR, captured ? GLFW_CURSOR_DISABLED : GLFW_CURSOR_NORMAL);
    if (glfwRawMouseMotionSupported() == GLFW_TRUE)
    {
        glfwSetInputMode(m_window, GLFW_RAW_MOUSE_MOTION, captured ? GLFW_TRUE : GLFW_FALSE);
    }
}

void Window::SetCursorShape(CursorShape shape)
{
    m_cursorShape = shape;
    if (m_window == nullptr)
    {
        return;
    }

    // nullptr restores the default arrow.
    glfwSetCursor(m_window, shape == CursorShape::Crosshair ? m_crosshairCursor : nullptr);
}

bool Window::IsFocused() const
{
    return m_window != nullptr && glfwGetWindowAttrib(m_window, GLFW_FOCUSED) == GLFW_TRUE;
}

bool Window::IsHovered() const
{
    return m_window != nullptr && glfwGetWindowAttrib(m_window, GLFW_HOVERED) == GLFW_TRUE;
}

void Window::SetResizeCallback(std::function<void(int, int)> callback)
{
    m_resizeCallback = std::move(callback);
}

void Window::SetFocusCallback(std::function<void(bool)> callback)
{
    m_focusCallback = std::move(callback);
}

Window* Window::FromHandle(GLFWwindow* window)
{
    return window != nullptr ? static_cast<Window*>(glfwGetWindowUserPointer(window)) : nullptr;
}

void Window::FramebufferResizeCallback(GLFWwindow* window, int width, int height)
{
    Window* self = FromHandle(window);
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

void Window::WindowSizeCallback(GLFWwindow* window, int width, int height)
{
    Window* self = FromHandle(window);
    if (self == nullptr)
    {
        return;
    }

    self->m_windowWidth = width;
    self->m_windowHeight = height;
}

void Window::FocusCallback(GLFWwindow* window, int focused)
{
    Window* self = FromHandle(window);
    if (self == nullptr || !self->m_focusCallback)
    {
        return;
    }

    self->m_focusCallback(focused == GLFW_TRUE);
}
} // namespace engine::platform
