#include "keys.hpp"
#include <linux/input-event-codes.h>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace netswitch {

namespace {

struct KeyEntry {
    Key key;
    uint16_t code;
    const char* name;
};

const KeyEntry KEY_TABLE[] = {
    {Key::A, KEY_A, "A"}, {Key::B, KEY_B, "B"}, {Key::C, KEY_C, "C"},
    {Key::D, KEY_D, "D"}, {Key::E, KEY_E, "E"}, {Key::F, KEY_F, "F"},
    {Key::G, KEY_G, "G"}, {Key::H, KEY_H, "H"}, {Key::I, KEY_I, "I"},
    {Key::J, KEY_J, "J"}, {Key::K, KEY_K, "K"}, {Key::L, KEY_L, "L"},
    {Key::M, KEY_M, "M"}, {Key::N, KEY_N, "N"}, {Key::O, KEY_O, "O"},
    {Key::P, KEY_P, "P"}, {Key::Q, KEY_Q, "Q"}, {Key::R, KEY_R, "R"},
    {Key::S, KEY_S, "S"}, {Key::T, KEY_T, "T"}, {Key::U, KEY_U, "U"},
    {Key::V, KEY_V, "V"}, {Key::W, KEY_W, "W"}, {Key::X, KEY_X, "X"},
    {Key::Y, KEY_Y, "Y"}, {Key::Z, KEY_Z, "Z"},

    {Key::D0, KEY_0, "D0"}, {Key::D1, KEY_1, "D1"}, {Key::D2, KEY_2, "D2"},
    {Key::D3, KEY_3, "D3"}, {Key::D4, KEY_4, "D4"}, {Key::D5, KEY_5, "D5"},
    {Key::D6, KEY_6, "D6"}, {Key::D7, KEY_7, "D7"}, {Key::D8, KEY_8, "D8"},
    {Key::D9, KEY_9, "D9"},

    {Key::F1, KEY_F1, "F1"}, {Key::F2, KEY_F2, "F2"}, {Key::F3, KEY_F3, "F3"},
    {Key::F4, KEY_F4, "F4"}, {Key::F5, KEY_F5, "F5"}, {Key::F6, KEY_F6, "F6"},
    {Key::F7, KEY_F7, "F7"}, {Key::F8, KEY_F8, "F8"}, {Key::F9, KEY_F9, "F9"},
    {Key::F10, KEY_F10, "F10"}, {Key::F11, KEY_F11, "F11"}, {Key::F12, KEY_F12, "F12"},

    {Key::Space, KEY_SPACE, "Space"},
    {Key::Enter, KEY_ENTER, "Enter"},
    {Key::Tab, KEY_TAB, "Tab"},
    {Key::Escape, KEY_ESC, "Escape"},
    {Key::Backspace, KEY_BACKSPACE, "Backspace"},
    {Key::Insert, KEY_INSERT, "Insert"},
    {Key::Delete, KEY_DELETE, "Delete"},
    {Key::Home, KEY_HOME, "Home"},
    {Key::End, KEY_END, "End"},
    {Key::PageUp, KEY_PAGEUP, "PageUp"},
    {Key::PageDown, KEY_PAGEDOWN, "PageDown"},
    {Key::Up, KEY_UP, "Up"},
    {Key::Down, KEY_DOWN, "Down"},
    {Key::Left, KEY_LEFT, "Left"},
    {Key::Right, KEY_RIGHT, "Right"},
    {Key::Pause, KEY_PAUSE, "Pause"},
    {Key::PrintScreen, KEY_SYSRQ, "PrintScreen"},
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

Key key_from_input_code(uint16_t code) {
    for (const auto& entry : KEY_TABLE) {
        if (entry.code == code) return entry.key;
    }
    return Key::None;
}

bool is_modifier_code(uint16_t code) {
    return modifier_from_input_code(code) != ModifierKeys::None;
}

ModifierKeys modifier_from_input_code(uint16_t code) {
    switch (code) {
        case KEY_LEFTCTRL:
        case KEY_RIGHTCTRL:
            return ModifierKeys::Control;
        case KEY_LEFTALT:
        case KEY_RIGHTALT:
            return ModifierKeys::Alt;
        case KEY_LEFTSHIFT:
        case KEY_RIGHTSHIFT:
            return ModifierKeys::Shift;
        case KEY_LEFTMETA:
        case KEY_RIGHTMETA:
            return ModifierKeys::Windows;
        default:
            return ModifierKeys::None;
    }
}

std::string key_name(Key key) {
    for (const auto& entry : KEY_TABLE) {
        if (entry.key == key) return entry.name;
    }
    return "None";
}

Key key_from_name(const std::string& name) {
    std::string lower = to_lower(trim(name));
    if (lower.empty()) return Key::None;

    for (const auto& entry : KEY_TABLE) {
        if (to_lower(entry.name) == lower) return entry.key;
    }

    // Accept bare digits ("1") as well as "D1"
    if (lower.size() == 1 && std::isdigit(static_cast<unsigned char>(lower[0]))) {
        return static_cast<Key>(static_cast<uint16_t>(Key::D0) + (lower[0] - '0'));
    }
    if (lower == "esc") return Key::Escape;
    if (lower == "return") return Key::Enter;
    return Key::None;
}

std::string modifiers_to_string(ModifierKeys mods) {
    std::string out;
    auto append = [&out](const char* part) {
        if (!out.empty()) out += "+";
        out += part;
    };
    if (has_modifier(mods, ModifierKeys::Control)) append("Ctrl");
    if (has_modifier(mods, ModifierKeys::Alt)) append("Alt");
    if (has_modifier(mods, ModifierKeys::Shift)) append("Shift");
    if (has_modifier(mods, ModifierKeys::Windows)) append("Win");
    return out.empty() ? "None" : out;
}

bool parse_modifiers(const std::string& text, ModifierKeys& out) {
    ModifierKeys mods = ModifierKeys::None;
    std::istringstream stream(text);
    std::string part;

    while (std::getline(stream, part, '+')) {
        std::string lower = to_lower(trim(part));
        if (lower == "ctrl" || lower == "control") {
            mods |= ModifierKeys::Control;
        } else if (lower == "alt") {
            mods |= ModifierKeys::Alt;
        } else if (lower == "shift") {
            mods |= ModifierKeys::Shift;
        } else if (lower == "win" || lower == "windows" || lower == "super" || lower == "meta") {
            mods |= ModifierKeys::Windows;
        } else if (lower == "none" || lower.empty()) {
            continue;
        } else {
            return false;
        }
    }

    out = mods;
    return true;
}

} // namespace netswitch
