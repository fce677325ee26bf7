#pragma once

#include <array>
#include <cstddef>
#include <optional>

#include <glm/vec2.hpp>

struct GLFWwindow;

namespace engine::platform
{
// Current and previous frame state for a fixed range of buttons or keys.
template <std::size_t Count>
struct ButtonStates
{
    std::array<unsigned char, Count> current{};
    std::array<unsigned char, Count> previous{};

    void Advance() { previous = current; }
    void Set(int index, bool down) { current[static_cast<std::size_t>(index)] = static_cast<unsigned char>(down); }

    [[nodiscard]] static bool InRange(int index) { return index >= 0 && index < static_cast<int>(Count); }
    [[nodiscard]] bool Down(int index) const { return InRange(index) && current[static_cast<std::size_t>(index)] != 0; }
    [[nodiscard]] bool WasDown(int index) const { return InRange(index) && previous[static_cast<std::size_t>(index)] != 0; }
    [[nodiscard]] bool Pressed(int index) const { return Down(index) && !WasDown(index); }
    [[nodiscard]] bool Released(int index) const { return !Down(index) && WasDown(index); }
};

class Input
{
public:
    void Update(GLFWwindow* window);

    // Next Update() reports a zero delta. Used after cursor mode switches, which jump the position.
    void DiscardMouseDelta();

    [[nodiscard]] bool IsKeyDown(int key) const { return m_keys.Down(key); }
    [[nodiscard]] bool IsKeyPressed(int key) const { return m_keys.Pressed(key); }
    [[nodiscard]] bool IsKeyReleased(int key) const { return m_keys.Released(key); }
    [[nodiscard]] bool IsMouseDown(int button) const { return m_mouse.Down(button); }
    [[nodiscard]] bool IsMousePressed(int button) const { return m_mouse.Pressed(button); }
    [[nodiscard]] bool IsMouseReleased(int button) const { return m_mouse.Released(button); }

    [[nodiscard]] glm::vec2 MousePosition() const { return m_mousePosition; }
    [[nodiscard]] glm::vec2 MouseDelta() const { return m_mouseDelta; }

    // Window-space cursor position, empty while the cursor is captured or outside the client area.
    [[nodiscard]] std::optional<glm::vec2> CursorPosition() const;

private:
    static constexpr std::size_t kMaxKeys = 512;
    static constexpr std::size_t kMaxMouseButtons = 8;

    ButtonStates<kMaxKeys> m_keys;
    ButtonStates<kMaxMouseButtons> m_mouse;

    glm::vec2 m_mousePosition{0.0F, 0.0F};
    glm::vec2 m_mouseDelta{0.0F, 0.0F};
    bool m_cursorInside = false;
    bool m_firstMouseSample = true;
};
} // namespace engine::platform
