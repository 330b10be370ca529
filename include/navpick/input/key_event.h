#pragma once

namespace navpick::input {

enum class Key {
    Character, // printable input, see KeyEvent::ch
    Enter,
    Escape,
    Backspace,
    Tab,
    Up,
    Down,
    PageUp,
    PageDown,
    Home,
    End
};

// One keystroke as delivered by the host terminal layer
struct KeyEvent {
    Key key = Key::Character;
    char ch = '\0';

    static KeyEvent character(char c) { return KeyEvent{Key::Character, c}; }
    static KeyEvent named(Key k) { return KeyEvent{k, '\0'}; }

    bool isCharacter() const noexcept { return key == Key::Character; }
};

} // namespace navpick::input
