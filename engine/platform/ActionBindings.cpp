#include "engine/platform/ActionBindings.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <utility>

#include <GLFW/glfw3.h>
#include <nlohmann/json.hpp>

#include "engine/platform/Input.hpp"

namespace engine::platform
{
namespace
{
using json = nlohmann::json;

constexpr float kMinMouseSensitivity = 0.00005F;
constexpr float kMaxMouseSensitivity = 0.05F;

struct NamedCode
{
    int code;
    const char* label;
};

constexpr std::array<NamedCode, 12> kNamedCodes{{
    {ActionBindings::kUnbound, "Unbound"},
    {ActionBindings::kMouseAxisX, "Mouse X"},
    {ActionBindings::kMouseAxisY, "Mouse Y"},
    {ActionBindings::kMouseOffset + GLFW_MOUSE_BUTTON_LEFT, "MouseLeft"},
    {ActionBindings::kMouseOffset + GLFW_MOUSE_BUTTON_RIGHT, "MouseRight"},
    {ActionBindings::kMouseOffset + GLFW_MOUSE_BUTTON_MIDDLE, "MouseMiddle"},
    {GLFW_KEY_ESCAPE, "Esc"},
    {GLFW_KEY_SPACE, "Space"},
    {GLFW_KEY_TAB, "Tab"},
    {GLFW_KEY_F1, "F1"},
    {GLFW_KEY_F2, "F2"},
    {GLFW_KEY_F3, "F3"},
}};

bool IsAxisCode(int code)
{
    return code == ActionBindings::kMouseAxisX || code == ActionBindings::kMouseAxisY;
}

bool ParseInt(const std::string& text, int* outValue)
{
    if (text.empty())
    {
        return false;
    }
    std::size_t consumed = 0;
    try
    {
        const int value = std::stoi(text, &consumed);
        if (consumed != text.size())
        {
            return false;
        }
        *outValue = value;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

// Accepts either a label string or a raw integer code.
bool ReadCode(const json& node, int* outCode)
{
    if (node.is_number_integer())
    {
        *outCode = node.get<int>();
        return true;
    }
    if (node.is_string())
    {
        return ActionBindings::LabelToCode(node.get<std::string>(), outCode);
    }
    return false;
}
} // namespace

ActionBindings::ActionBindings()
{
    ResetDefaults();
}

void ActionBindings::ResetDefaults()
{
    m_bindings.fill(ActionBinding{});

    SetCode(InputAction::DispelDraw, 0, EncodeMouseButton(GLFW_MOUSE_BUTTON_LEFT));
    SetCode(InputAction::DispelCancel, 0, EncodeMouseButton(GLFW_MOUSE_BUTTON_RIGHT));
    SetCode(InputAction::Pause, 0, GLFW_KEY_ESCAPE);
    SetCode(InputAction::LookX, 0, kMouseAxisX);
    SetCode(InputAction::LookY, 0, kMouseAxisY);
    SetCode(InputAction::ToggleDebugHud, 0, GLFW_KEY_F1);
    m_mouseSensitivity = kDefaultMouseSensitivity;
}

const ActionBinding& ActionBindings::Get(InputAction action) const
{
    return m_bindings[static_cast<std::size_t>(action)];
}

void ActionBindings::Set(InputAction action, const ActionBinding& binding)
{
    m_bindings[static_cast<std::size_t>(action)] = binding;
}

void ActionBindings::SetCode(InputAction action, int slot, int code)
{
    ActionBinding& binding = m_bindings[static_cast<std::size_t>(action)];
    (slot <= 0 ? binding.primary : binding.secondary) = code;
}

int ActionBindings::GetCode(InputAction action, int slot) const
{
    const ActionBinding& binding = Get(action);
    return slot <= 0 ? binding.primary : binding.secondary;
}

void ActionBindings::SetMouseSensitivity(float sensitivity)
{
    m_mouseSensitivity = std::clamp(sensitivity, kMinMouseSensitivity, kMaxMouseSensitivity);
}

bool ActionBindings::Query(const Input& input, InputAction action, Edge edge) const
{
    const ActionBinding& binding = Get(action);
    for (const int code : {binding.primary, binding.secondary})
    {
        if (code == kUnbound || IsAxisCode(code))
        {
            continue;
        }

        bool hit = false;
        if (IsMouseCode(code))
        {
            const int button = DecodeMouseButton(code);
            hit = edge == Edge::Pressed    ? input.IsMousePressed(button)
                  : edge == Edge::Released ? input.IsMouseReleased(button)
                                           : input.IsMouseDown(button);
        }
        else
        {
            hit = edge == Edge::Pressed    ? input.IsKeyPressed(code)
                  : edge == Edge::Released ? input.IsKeyReleased(code)
                                           : input.IsKeyDown(code);
        }
        if (hit)
        {
            return true;
        }
    }
    return false;
}

bool ActionBindings::IsDown(const Input& input, InputAction action) const
{
    return Query(input, action, Edge::Down);
}

bool ActionBindings::IsPressed(const Input& input, InputAction action) const
{
    return Query(input, action, Edge::Pressed);
}

bool ActionBindings::IsReleased(const Input& input, InputAction action) const
{
    return Query(input, action, Edge::Released);
}

bool ActionBindings::HasDispelConflict() const
{
    // A cancel press always wins, so sharing an input with drawing makes loops impossible to close.
    const ActionBinding& draw = Get(InputAction::DispelDraw);
    const ActionBinding& cancel = Get(InputAction::DispelCancel);
    for (const int drawCode : {draw.primary, draw.secondary})
    {
        if (drawCode != kUnbound && (drawCode == cancel.primary || drawCode == cancel.secondary))
        {
            return true;
        }
    }
    return false;
}

bool ActionBindings::LoadFromJsonFile(const std::string& path, std::string* outError)
{
    auto fail = [outError](const std::string& message) {
        if (outError != nullptr)
        {
            *outError = message;
        }
        return false;
    };

    std::ifstream stream(path);
    if (!stream.is_open())
    {
        return fail("Cannot open controls file: " + path);
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& ex)
    {
        return fail(std::string{"Invalid controls JSON: "} + ex.what());
    }

    if (!root.is_object() || !root.contains("bindings") || !root["bindings"].is_object())
    {
        return fail("Missing controls.bindings object");
    }

    ResetDefaults();
    if (root.contains("mouse_sensitivity") && root["mouse_sensitivity"].is_number())
    {
        SetMouseSensitivity(root["mouse_sensitivity"].get<float>());
    }

    const json& bindings = root["bindings"];
    for (InputAction action : AllActions())
    {
        const auto it = bindings.find(ActionName(action));
        if (it == bindings.end() || !it->is_object())
        {
            continue;
        }

        ActionBinding binding = Get(action);
        int code = kUnbound;
        if (it->contains("primary") && ReadCode(it->at("primary"), &code))
        {
            binding.primary = code;
        }
        if (it->contains("secondary") && ReadCode(it->at("secondary"), &code))
        {
            binding.secondary = code;
        }
        Set(action, binding);
    }

    if (HasDispelConflict())
    {
        ResetDefaults();
        return fail("DispelDraw and DispelCancel share an input");
    }
    return true;
}

bool ActionBindings::SaveToJsonFile(const std::string& path, std::string* outError) const
{
    const std::filesystem::path filePath(path);
    if (filePath.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(filePath.parent_path(), ec);
    }

    json bindings = json::object();
    for (InputAction action : AllActions())
    {
        const ActionBinding& binding = Get(action);
        bindings[ActionName(action)] = {
            {"primary", CodeToLabel(binding.primary)},
            {"secondary", CodeToLabel(binding.secondary)},
        };
    }

    json root;
    root["asset_version"] = 1;
    root["mouse_sensitivity"] = m_mouseSensitivity;
    root["bindings"] = std::move(bindings);

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Cannot write controls file: " + path;
        }
        return false;
    }

    stream << root.dump(2) << "\n";
    return true;
}

std::vector<InputAction> ActionBindings::AllActions()
{
    std::vector<InputAction> actions;
    actions.reserve(static_cast<std::size_t>(InputAction::Count));
    for (std::size_t i = 0; i < static_cast<std::size_t>(InputAction::Count); ++i)
    {
        actions.push_back(static_cast<InputAction>(i));
    }
    return actions;
}

const char* ActionBindings::ActionName(InputAction action)
{
    switch (action)
    {
        case InputAction::DispelDraw: return "DispelDraw";
        case InputAction::DispelCancel: return "DispelCancel";
        case InputAction::Pause: return "Pause";
        case InputAction::LookX: return "LookX";
        case InputAction::LookY: return "LookY";
        case InputAction::ToggleDebugHud: return "ToggleDebugHUD";
        default: return "Unknown";
    }
}

std::string ActionBindings::CodeToLabel(int code)
{
    const auto it = std::find_if(kNamedCodes.begin(), kNamedCodes.end(), [code](const NamedCode& named) {
        return named.code == code;
    });
    if (it != kNamedCodes.end())
    {
        return it->label;
    }

    // Printable keys use their own character.
    if (code >= GLFW_KEY_A && code <= GLFW_KEY_Z)
    {
        return std::string(1, static_cast<char>(code));
    }
    if (IsMouseCode(code))
    {
        return "Mouse" + std::to_string(DecodeMouseButton(code));
    }
    return "Key(" + std::to_string(code) + ")";
}

bool ActionBindings::LabelToCode(const std::string& label, int* outCode)
{
    const auto it = std::find_if(kNamedCodes.begin(), kNamedCodes.end(), [&label](const NamedCode& named) {
        return label == named.label;
    });
    if (it != kNamedCodes.end())
    {
        *outCode = it->code;
        return true;
    }

    if (label.size() == 1U && label[0] >= 'A' && label[0] <= 'Z')
    {
        *outCode = static_cast<int>(label[0]);
        return true;
    }

    int value = 0;
    if (label.rfind("Mouse", 0) == 0 && ParseInt(label.substr(5), &value) && value >= 0)
    {
        *outCode = EncodeMouseButton(value);
        return true;
    }
    if (label.size() > 5U && label.rfind("Key(", 0) == 0 && label.back() == ')'
        && ParseInt(label.substr(4, label.size() - 5U), &value))
    {
        *outCode = value;
        return true;
    }
    return false;
}
} // namespace engine::platform
