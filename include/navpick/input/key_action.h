#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace navpick::input {

// Logical navigation commands, decoupled from the keystrokes that trigger them.
enum class KeyAction {
    MoveDown,
    MoveUp,
    PageDown,
    PageUp,
    Enter,
    Back,
    Top,
    Bottom,
    Cancel,
    Search,
    Command,
    Refresh,
    Info,
    Help,
    Download
};

inline constexpr std::array<KeyAction, 15> kAllKeyActions = {
    KeyAction::MoveDown, KeyAction::MoveUp,  KeyAction::PageDown, KeyAction::PageUp,
    KeyAction::Enter,    KeyAction::Back,    KeyAction::Top,      KeyAction::Bottom,
    KeyAction::Cancel,   KeyAction::Search,  KeyAction::Command,  KeyAction::Refresh,
    KeyAction::Info,     KeyAction::Help,    KeyAction::Download};

constexpr const char* keyActionName(KeyAction action) {
    switch (action) {
        case KeyAction::MoveDown:
            return "move_down";
        case KeyAction::MoveUp:
            return "move_up";
        case KeyAction::PageDown:
            return "page_down";
        case KeyAction::PageUp:
            return "page_up";
        case KeyAction::Enter:
            return "enter";
        case KeyAction::Back:
            return "back";
        case KeyAction::Top:
            return "top";
        case KeyAction::Bottom:
            return "bottom";
        case KeyAction::Cancel:
            return "cancel";
        case KeyAction::Search:
            return "search";
        case KeyAction::Command:
            return "command";
        case KeyAction::Refresh:
            return "refresh";
        case KeyAction::Info:
            return "info";
        case KeyAction::Help:
            return "help";
        case KeyAction::Download:
            return "download";
    }
    return "unknown";
}

// Accepts the snake_case names above; '-' is treated as '_' and case is ignored.
std::optional<KeyAction> parseKeyAction(std::string_view name);

} // namespace navpick::input
