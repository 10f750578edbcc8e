#include "config.hpp"

namespace netswitch {

std::vector<std::string> ApplicationConfig::validate() const {
    std::vector<std::string> errors;

    if (window.width < MIN_WINDOW_WIDTH || window.height < MIN_WINDOW_HEIGHT) {
        errors.push_back("Window is too small, minimum size is 400x300");
    }

    std::vector<const HotkeyConfig*> active;
    for (const auto& hotkey : hotkeys) {
        if (hotkey.enabled && hotkey.is_valid()) active.push_back(&hotkey);
    }
    for (size_t i = 0; i < active.size(); ++i) {
        for (size_t j = i + 1; j < active.size(); ++j) {
            if (active[i]->modifiers == active[j]->modifiers && active[i]->key == active[j]->key) {
                errors.push_back(std::string("Hotkey conflict: ") +
                                 action_display_name(active[i]->action) + " and " +
                                 action_display_name(active[j]->action) + " both use " +
                                 active[i]->display_text());
            }
        }
    }

    if (!adapter_a.empty() && same_device_id(adapter_a, adapter_b)) {
        errors.push_back("Adapter A and adapter B must be different devices");
    }

    if (refresh_interval < 0) {
        errors.push_back("Refresh interval must not be negative");
    } else if (refresh_interval > 0 &&
               (refresh_interval < MIN_REFRESH_INTERVAL || refresh_interval > MAX_REFRESH_INTERVAL)) {
        errors.push_back("Refresh interval must be between 5 and 3600 seconds, or 0 to disable");
    }

    return errors;
}

const HotkeyConfig* ApplicationConfig::find_hotkey(HotkeyAction action) const {
    for (const auto& hotkey : hotkeys) {
        if (hotkey.action == action) return &hotkey;
    }
    return nullptr;
}

void ApplicationConfig::update_hotkey(const HotkeyConfig& hotkey) {
    for (auto& existing : hotkeys) {
        if (existing == hotkey) {
            existing.modifiers = hotkey.modifiers;
            existing.key = hotkey.key;
            existing.enabled = hotkey.enabled;
            return;
        }
    }
    hotkeys.push_back(hotkey);
}

} // namespace netswitch
