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
    DispelDraw = 0,
    DispelCancel,
    Pause,
    LookX,
    LookY,
    ToggleDebugHud,
    Count
};

struct ActionBinding
{
    int primary = -1;
    int secondary = -1;
};

class ActionBindings
{
public:
    static constexpr int kUnbound = -1;
    static constexpr int kMouseOffset = 10000;
    static constexpr int kMouseAxisX = -1001;
    static constexpr int kMouseAxisY = -1002;
    static constexpr float kDefaultMouseSensitivity = 0.001F;

    ActionBindings();

    void ResetDefaults();

    [[nodiscard]] const ActionBinding& Get(InputAction action) const;
    void Set(InputAction action, const ActionBinding& binding);
    void SetCode(InputAction action, int slot, int code);
    [[nodiscard]] int GetCode(InputAction action, int slot) const;

    [[nodiscard]] bool IsDown(const Input& input, InputAction action) const;
    [[nodiscard]] bool IsPressed(const Input& input, InputAction action) const;
    [[nodiscard]] bool IsReleased(const Input& input, InputAction action) const;

    // Radians of look rotation per pixel of mouse motion.
    [[nodiscard]] float MouseSensitivity() const { return m_mouseSensitivity; }
    void SetMouseSensitivity(float sensitivity);

    /// Bindings are stored as labels ("MouseLeft", "Esc", "Key(81)"); raw integer codes are
    /// accepted on load. Fails without touching the current bindings when the file cannot be
    /// read, and falls back to defaults when drawing and cancelling end up on the same input.
    [[nodiscard]] bool LoadFromJsonFile(const std::string& path, std::string* outError = nullptr);
    [[nodiscard]] bool SaveToJsonFile(const std::string& path, std::string* outError = nullptr) const;

    [[nodiscard]] static std::vector<InputAction> AllActions();
    [[nodiscard]] static const char* ActionName(InputAction action);
    [[nodiscard]] static std::string CodeToLabel(int code);
    [[nodiscard]] static bool LabelToCode(const std::string& label, int* outCode);

    [[nodiscard]] static int EncodeMouseButton(int button) { return kMouseOffset + button; }
    [[nodiscard]] static bool IsMouseCode(int code) { return code >= kMouseOffset; }
    [[nodiscard]] static int DecodeMouseButton(int code) { return code - kMouseOffset; }

private:
    enum class Edge
    {
        Down,
        Pressed,
        Released
    };

    [[nodiscard]] bool Query(const Input& input, InputAction action, Edge edge) const;
    [[nodiscard]] bool HasDispelConflict() const;

    std::array<ActionBinding, static_cast<std::size_t>(InputAction::Count)> m_bindings{};
    float m_mouseSensitivity = kDefaultMouseSensitivity;
};
} // namespace engine::platform
