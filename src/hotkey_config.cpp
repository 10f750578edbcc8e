#include "hotkey_config.hpp"
#include <algorithm>
#include <cctype>

namespace netswitch {

const char* action_name(HotkeyAction action) {
    switch (action) {
        case HotkeyAction::EnableAll: return "EnableAll";
        case HotkeyAction::DisableAll: return "DisableAll";
        case HotkeyAction::SwitchAdapters: return "SwitchAdapters";
    }
    return "Unknown";
}

const char* action_display_name(HotkeyAction action) {
    switch (action) {
        case HotkeyAction::EnableAll: return "Enable all";
        case HotkeyAction::DisableAll: return "Disable all";
        case HotkeyAction::SwitchAdapters: return "Switch adapters";
    }
    return "Unknown action";
}

const char* action_description(HotkeyAction action) {
    switch (action) {
        case HotkeyAction::EnableAll: return "Enable every network adapter";
        case HotkeyAction::DisableAll: return "Disable every network adapter";
        case HotkeyAction::SwitchAdapters: return "Toggle between the two configured adapters";
    }
    return "Unknown action";
}

bool action_from_name(const std::string& name, HotkeyAction& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "enableall") {
        out = HotkeyAction::EnableAll;
    } else if (lower == "disableall") {
        out = HotkeyAction::DisableAll;
    } else if (lower == "switchadapters" || lower == "switch") {
        out = HotkeyAction::SwitchAdapters;
    } else {
        return false;
    }
    return true;
}

std::string HotkeyConfig::display_text() const {
    std::string text;
    auto append = [&text](const std::string& part) {
        if (!text.empty()) text += " + ";
        text += part;
    };

    if (has_modifier(modifiers, ModifierKeys::Control)) append("Ctrl");
    if (has_modifier(modifiers, ModifierKeys::Alt)) append("Alt");
    if (has_modifier(modifiers, ModifierKeys::Shift)) append("Shift");
    if (has_modifier(modifiers, ModifierKeys::Windows)) append("Win");
    if (key != Key::None) append(key_name(key));

    return text;
}

std::string HotkeyConfig::to_string() const {
    return std::string(action_display_name(action)) + ": " + display_text();
}

std::vector<HotkeyConfig> default_hotkeys() {
    // Ctrl+Alt+F1..F12 switch virtual terminals on Linux
    const ModifierKeys ctrl_alt_shift = ModifierKeys::Control | ModifierKeys::Alt | ModifierKeys::Shift;
    return {
        {1, HotkeyAction::EnableAll, ctrl_alt_shift, Key::E, true},
        {2, HotkeyAction::DisableAll, ctrl_alt_shift, Key::D, true},
        {3, HotkeyAction::SwitchAdapters, ctrl_alt_shift, Key::S, true},
    };
}

} // namespace netswitch
