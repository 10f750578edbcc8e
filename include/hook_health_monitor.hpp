#pragma once

#include "keyboard_hook.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace netswitch {

// Periodically checks that the keyboard hook still holds a live handle and
// reinstalls it when it does not.
//
// Only a dropped handle is repaired. A hook that is installed but silently
// receives nothing looks the same as a user who is not typing, so inactivity
// is reported in status() and the log but never triggers a reinstall.
class HookHealthMonitor {
public:
    static constexpr std::chrono::milliseconds DEFAULT_INTERVAL{30000};
    static constexpr std::chrono::milliseconds DEFAULT_INACTIVITY_THRESHOLD{60000};

    explicit HookHealthMonitor(KeyboardHook& hook,
                               std::chrono::milliseconds interval = DEFAULT_INTERVAL,
                               std::chrono::milliseconds inactivity_threshold = DEFAULT_INACTIVITY_THRESHOLD);
    ~HookHealthMonitor();

    HookHealthMonitor(const HookHealthMonitor&) = delete;
    HookHealthMonitor& operator=(const HookHealthMonitor&) = delete;

    // Start/stop the timer thread
    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    // One health-check cycle; the timer calls this every interval
    void check_now();

    // Reinstall regardless of state
    bool force_reinstall();

    // "Hook: installed | Inactive: 12s | Reinstalls: 0 | Hotkeys: 3"
    std::string status() const;

    int reinstall_count() const { return reinstall_count_.load(); }
    std::chrono::steady_clock::time_point last_reinstall() const;

private:
    bool reinstall_hook();
    void run_loop();

    KeyboardHook& hook_;
    std::chrono::milliseconds interval_;
    std::chrono::milliseconds inactivity_threshold_;

    std::atomic<bool> running_{false};
    std::thread timer_thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    // Serializes check_now() and force_reinstall()
    std::mutex reinstall_mutex_;
    std::atomic<int> reinstall_count_{0};
    mutable std::mutex time_mutex_;
    std::chrono::steady_clock::time_point last_reinstall_;
};

} // namespace netswitch
