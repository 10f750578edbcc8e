#pragma once

#include <string>
#include <cstdint>

namespace netswitch {

// Abstract key identifier, independent of the input backend's code space
enum class Key : uint16_t {
    None = 0,
    A, B, C, D, E, F, G, H, I, J, K, L, M,
    N, O, P, Q, R, S, T, U, V, W, X, Y, Z,
    D0, D1, D2, D3, D4, D5, D6, D7, D8, D9,
    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
    Space, Enter, Tab, Escape, Backspace,
    Insert, Delete, Home, End, PageUp, PageDown,
    Up, Down, Left, Right,
    Pause, PrintScreen
};

// Modifier flags (values are persisted, do not renumber)
enum class ModifierKeys : uint32_t {
    None = 0,
    Alt = 1,
    Control = 2,
    Shift = 4,
    Windows = 8
};

inline ModifierKeys operator|(ModifierKeys a, ModifierKeys b) {
    return static_cast<ModifierKeys>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline ModifierKeys operator&(ModifierKeys a, ModifierKeys b) {
    return static_cast<ModifierKeys>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline ModifierKeys& operator|=(ModifierKeys& a, ModifierKeys b) {
    a = a | b;
    return a;
}

inline bool has_modifier(ModifierKeys mask, ModifierKeys flag) {
    return (mask & flag) != ModifierKeys::None;
}

// Map a Linux input event code (KEY_*) to a Key. Modifiers and unknown codes map to None.
Key key_from_input_code(uint16_t code);

// True for left/right Ctrl, Alt, Shift and Meta
bool is_modifier_code(uint16_t code);

// Modifier flag contributed by a modifier code, None for anything else
ModifierKeys modifier_from_input_code(uint16_t code);

// Stable text names ("F1", "A", "PageUp"), used in config files and display text
std::string key_name(Key key);
Key key_from_name(const std::string& name);

// "Ctrl+Alt" style text, and its inverse. Parsing accepts Ctrl/Control,
// Alt, Shift, Win/Windows/Super/Meta in any case, separated by '+'.
std::string modifiers_to_string(ModifierKeys mods);
bool parse_modifiers(const std::string& text, ModifierKeys& out);

} // namespace netswitch
