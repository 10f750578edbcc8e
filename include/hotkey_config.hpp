#pragma once

#include "keys.hpp"
#include <string>
#include <vector>

namespace netswitch {

enum class HotkeyAction {
    EnableAll,
    DisableAll,
    SwitchAdapters
};

const char* action_name(HotkeyAction action);           // "EnableAll", persisted
const char* action_display_name(HotkeyAction action);   // "Enable all"
const char* action_description(HotkeyAction action);
bool action_from_name(const std::string& name, HotkeyAction& out);

struct HotkeyConfig {
    int id = 0;
    HotkeyAction action = HotkeyAction::EnableAll;
    ModifierKeys modifiers = ModifierKeys::None;
    Key key = Key::None;
    bool enabled = false;

    // A combination needs at least one modifier and a real key
    bool is_valid() const {
        return modifiers != ModifierKeys::None && key != Key::None;
    }

    // "Ctrl + Alt + Shift + S"
    std::string display_text() const;

    // "Switch adapters: Ctrl + Alt + Shift + S"
    std::string to_string() const;

    // Identity is the id; two entries with the same combination are still distinct
    bool operator==(const HotkeyConfig& other) const { return id == other.id; }
    bool operator!=(const HotkeyConfig& other) const { return id != other.id; }
};

// Ctrl+Alt+Shift+E enable all, Ctrl+Alt+Shift+D disable all, Ctrl+Alt+Shift+S switch
std::vector<HotkeyConfig> default_hotkeys();

} // namespace netswitch
