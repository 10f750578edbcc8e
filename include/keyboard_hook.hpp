#pragma once

#include "hotkey_config.hpp"
#include "key_event_source.hpp"

#include <functional>
#include <atomic>
#include <thread>
#include <mutex>
#include <memory>
#include <chrono>
#include <vector>
#include <unordered_set>
#include <cstdint>

namespace netswitch {

// Global keyboard hook: watches every key press system-wide and reports
// configured combinations. Owns its event source and listener thread.
class KeyboardHook {
public:
    using TriggerCallback = std::function<void(const HotkeyConfig& hotkey)>;

    explicit KeyboardHook(std::unique_ptr<KeyEventSource> source);
    ~KeyboardHook();

    KeyboardHook(const KeyboardHook&) = delete;
    KeyboardHook& operator=(const KeyboardHook&) = delete;

    // Open the source and start listening. Returns false (and logs why) on failure;
    // nothing is retried here.
    bool install();

    // Stop listening, close the source and forget pressed keys
    void uninstall();

    // uninstall() followed by install()
    bool reinstall();

    bool is_installed() const { return installed_.load(); }

    // Replace the monitored list. Only enabled and valid entries are kept.
    void update_hotkeys(const std::vector<HotkeyConfig>& hotkeys);
    size_t hotkey_count() const;

    // Called from the listener thread; must stay cheap
    void set_callback(TriggerCallback callback);

    // Feed one key transition through the matcher.
    // Public so the listener and tests share one path.
    void process_key_event(uint16_t code, int value);

    ModifierKeys current_modifiers() const;

    std::chrono::steady_clock::time_point last_activity() const;
    std::string source_description() const;

private:
    void run_loop();
    ModifierKeys modifiers_locked() const;

    std::unique_ptr<KeyEventSource> source_;

    // Install/uninstall/reinstall
    mutable std::mutex lifecycle_mutex_;

    // Pressed keys, hotkey list and callback
    mutable std::mutex state_mutex_;
    std::unordered_set<uint16_t> pressed_;
    std::vector<HotkeyConfig> hotkeys_;
    TriggerCallback callback_;

    std::atomic<bool> running_{false};
    std::atomic<bool> installed_{false};
    std::atomic<int64_t> last_activity_ns_{0};
    std::thread listener_thread_;
};

} // namespace netswitch
