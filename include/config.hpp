#pragma once

#include "hotkey_config.hpp"
#include "network_adapter.hpp"
#include <string>
#include <vector>

namespace netswitch {

struct WindowPosition {
    double x = 100;
    double y = 100;
    double width = 800;
    double height = 600;
};

// Minimum window size accepted by validate()
constexpr double MIN_WINDOW_WIDTH = 400;
constexpr double MIN_WINDOW_HEIGHT = 300;

// Refresh interval bounds in seconds; 0 turns periodic refresh off
constexpr int MIN_REFRESH_INTERVAL = 5;
constexpr int MAX_REFRESH_INTERVAL = 3600;

struct ApplicationConfig {
    std::vector<HotkeyConfig> hotkeys = default_hotkeys();

    // Adapters toggled by SwitchAdapters
    std::string adapter_a;
    std::string adapter_b;

    WindowPosition window;

    // Behavior
    bool start_with_system = false;
    bool minimize_to_tray = true;
    bool minimize_to_tray_on_close = true;
    bool show_notifications = true;
    bool enable_logging = false;     // Copy log lines to ~/.netswitch/netswitch.log
    int refresh_interval = 60;       // Seconds between adapter list refreshes

    // Keyboard device for the hook; empty listens on every keyboard found
    std::string keyboard_device;

    bool is_switch_configured() const {
        return !adapter_a.empty() && !adapter_b.empty() && !same_device_id(adapter_a, adapter_b);
    }

    // Human-readable problems; empty when the config is usable.
    // Reports window too small, two enabled hotkeys with the same combination,
    // adapter A equal to B, and an out-of-range refresh interval.
    std::vector<std::string> validate() const;

    // First hotkey bound to action, nullptr if none
    const HotkeyConfig* find_hotkey(HotkeyAction action) const;

    // Replace combination and enabled flag of the entry with the same id, or append
    void update_hotkey(const HotkeyConfig& hotkey);
};

} // namespace netswitch
