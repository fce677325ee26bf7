#include "engine/platform/Input.hpp"

#include <GLFW/glfw3.h>

namespace engine::platform
{
void Input::Update(GLFWwindow* window)
{
    m_keys.Advance();
    m_mouse.Advance();

    // GLFW_KEY_SPACE is the lowest valid key code; lower codes would raise GLFW_INVALID_ENUM.
    for (int key = GLFW_KEY_SPACE; key < static_cast<int>(kMaxKeys) && key <= GLFW_KEY_LAST; ++key)
    {
        m_keys.Set(key, glfwGetKey(window, key) == GLFW_PRESS);
    }
    for (int button = 0; button < static_cast<int>(kMaxMouseButtons) && button <= GLFW_MOUSE_BUTTON_LAST; ++button)
    {
        m_mouse.Set(button, glfwGetMouseButton(window, button) == GLFW_PRESS);
    }

    double cursorX = 0.0;
    double cursorY = 0.0;
    glfwGetCursorPos(window, &cursorX, &cursorY);
    const glm::vec2 position{static_cast<float>(cursorX), static_cast<float>(cursorY)};

    m_mouseDelta = m_firstMouseSample ? glm::vec2{0.0F} : position - m_mousePosition;
    m_mousePosition = position;
    m_firstMouseSample = false;

    int windowWidth = 0;
    int windowHeight = 0;
    glfwGetWindowSize(window, &windowWidth, &windowHeight);
    const bool hovered = glfwGetWindowAttrib(window, GLFW_HOVERED) == GLFW_TRUE;
    const bool captured = glfwGetInputMode(window, GLFW_CURSOR) == GLFW_CURSOR_DISABLED;
    const bool insideClient = cursorX >= 0.0 && cursorY >= 0.0 && cursorX < static_cast<double>(windowWidth)
                              && cursorY < static_cast<double>(windowHeight);
    m_cursorInside = hovered && !captured && insideClient;
}

void Input::DiscardMouseDelta()
{
    m_mouseDelta = glm::vec2{0.0F};
    m_firstMouseSample = true;
}

std::optional<glm::vec2> Input::CursorPosition() const
{
    if (!m_cursorInside)
    {
        return std::nullopt;
    }
    return m_mousePosition;
}
} // namespace engine::platform
