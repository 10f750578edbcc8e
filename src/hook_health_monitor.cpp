#include "hook_health_monitor.hpp"
#include "log.hpp"
#include <sstream>

namespace netswitch {

static constexpr const char* TAG = "health";

HookHealthMonitor::HookHealthMonitor(KeyboardHook& hook,
                                     std::chrono::milliseconds interval,
                                     std::chrono::milliseconds inactivity_threshold)
    : hook_(hook)
    , interval_(interval)
    , inactivity_threshold_(inactivity_threshold) {
}

HookHealthMonitor::~HookHealthMonitor() {
    stop();
}

void HookHealthMonitor::start() {
    if (running_.load()) return;

    running_.store(true);
    timer_thread_ = std::thread([this]() {
        run_loop();
    });
}

void HookHealthMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (!running_.load()) return;
        running_.store(false);
    }
    wake_cv_.notify_all();

    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
}

void HookHealthMonitor::run_loop() {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    while (running_.load()) {
        if (wake_cv_.wait_for(lock, interval_, [this]() { return !running_.load(); })) {
            break;
        }

        lock.unlock();
        check_now();
        lock.lock();
    }
}

void HookHealthMonitor::check_now() {
    std::lock_guard<std::mutex> lock(reinstall_mutex_);

    if (!hook_.is_installed()) {
        Log::warn(TAG, "Keyboard hook handle is gone, reinstalling");
        reinstall_hook();
        return;
    }

    auto inactive = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - hook_.last_activity());
    if (inactive > inactivity_threshold_) {
        Log::info(TAG, "No key activity for " + std::to_string(inactive.count()) +
                       "s (reinstalls: " + std::to_string(reinstall_count_.load()) + ")");
    }
}

bool HookHealthMonitor::force_reinstall() {
    std::lock_guard<std::mutex> lock(reinstall_mutex_);
    return reinstall_hook();
}

bool HookHealthMonitor::reinstall_hook() {
    Log::info(TAG, "Reinstalling keyboard hook (attempt " +
                   std::to_string(reinstall_count_.load() + 1) + ")");

    if (!hook_.reinstall()) {
        Log::error(TAG, "Keyboard hook reinstall failed");
        return false;
    }

    int count = ++reinstall_count_;
    {
        std::lock_guard<std::mutex> time_lock(time_mutex_);
        last_reinstall_ = std::chrono::steady_clock::now();
    }
    Log::info(TAG, "Keyboard hook reinstalled (total: " + std::to_string(count) + ")");
    return true;
}

std::chrono::steady_clock::time_point HookHealthMonitor::last_reinstall() const {
    std::lock_guard<std::mutex> lock(time_mutex_);
    return last_reinstall_;
}

std::string HookHealthMonitor::status() const {
    auto inactive = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - hook_.last_activity());

    std::ostringstream out;
    out << "Hook: " << (hook_.is_installed() ? "installed" : "not installed")
        << " | Inactive: " << inactive.count() << "s"
        << " | Reinstalls: " << reinstall_count_.load()
        << " | Hotkeys: " << hook_.hotkey_count();
    return out.str();
}

} // namespace netswitch
