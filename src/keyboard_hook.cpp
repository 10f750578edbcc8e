#include "keyboard_hook.hpp"
#include "log.hpp"
#include <exception>
#include <optional>

namespace netswitch {

static constexpr const char* TAG = "hook";

// Listener wakes at least this often to notice uninstall()
static constexpr int POLL_TIMEOUT_MS = 100;

static int64_t steady_now_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

KeyboardHook::KeyboardHook(std::unique_ptr<KeyEventSource> source)
    : source_(std::move(source)) {
    last_activity_ns_.store(steady_now_ns());
}

KeyboardHook::~KeyboardHook() {
    uninstall();
}

bool KeyboardHook::install() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (installed_.load()) return true;

    if (!source_) {
        Log::error(TAG, "No keyboard event source configured");
        return false;
    }

    // A previous listener may have exited on device loss
    if (listener_thread_.joinable()) {
        running_.store(false);
        listener_thread_.join();
    }

    if (!source_->open()) {
        Log::error(TAG, "Failed to install keyboard hook on " + source_->description());
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pressed_.clear();
    }

    installed_.store(true);
    running_.store(true);
    last_activity_ns_.store(steady_now_ns());

    listener_thread_ = std::thread([this]() {
        run_loop();
    });

    Log::info(TAG, "Keyboard hook installed on " + source_->description());
    return true;
}

void KeyboardHook::uninstall() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    running_.store(false);
    if (listener_thread_.joinable()) {
        listener_thread_.join();
    }

    bool was_installed = installed_.exchange(false);
    if (source_ && source_->is_open()) {
        source_->close();
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pressed_.clear();
    }

    if (was_installed) {
        Log::info(TAG, "Keyboard hook removed");
    }
}

bool KeyboardHook::reinstall() {
    uninstall();
    return install();
}

void KeyboardHook::update_hotkeys(const std::vector<HotkeyConfig>& hotkeys) {
    std::vector<HotkeyConfig> active;
    active.reserve(hotkeys.size());
    for (const auto& hotkey : hotkeys) {
        if (hotkey.enabled && hotkey.is_valid()) {
            active.push_back(hotkey);
        }
    }

    size_t count = active.size();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        hotkeys_ = std::move(active);
    }
    Log::info(TAG, "Monitoring " + std::to_string(count) + " hotkey(s)");
}

size_t KeyboardHook::hotkey_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return hotkeys_.size();
}

void KeyboardHook::set_callback(TriggerCallback callback) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    callback_ = std::move(callback);
}

void KeyboardHook::process_key_event(uint16_t code, int value) {
    last_activity_ns_.store(steady_now_ns());

    std::optional<HotkeyConfig> matched;
    TriggerCallback callback;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);

        if (value == KEY_VALUE_RELEASED) {
            pressed_.erase(code);
            return;
        }

        bool already_down = !pressed_.insert(code).second;

        // Modifiers only feed the mask; autorepeat never re-fires
        if (is_modifier_code(code)) return;
        if (value == KEY_VALUE_REPEAT || already_down) return;

        Key key = key_from_input_code(code);
        if (key == Key::None) return;

        ModifierKeys mods = modifiers_locked();

        // First match in list order wins
        for (const auto& hotkey : hotkeys_) {
            if (hotkey.key == key && hotkey.modifiers == mods) {
                matched = hotkey;
                break;
            }
        }
        callback = callback_;
    }

    if (!matched || !callback) return;

    try {
        callback(*matched);
    } catch (const std::exception& e) {
        Log::error(TAG, std::string("Hotkey handler threw: ") + e.what());
    } catch (...) {
        Log::error(TAG, "Hotkey handler threw a non-standard exception");
    }
}

ModifierKeys KeyboardHook::current_modifiers() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return modifiers_locked();
}

ModifierKeys KeyboardHook::modifiers_locked() const {
    ModifierKeys mods = ModifierKeys::None;
    for (uint16_t code : pressed_) {
        mods |= modifier_from_input_code(code);
    }
    return mods;
}

std::chrono::steady_clock::time_point KeyboardHook::last_activity() const {
    return std::chrono::steady_clock::time_point(
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::nanoseconds(last_activity_ns_.load())));
}

std::string KeyboardHook::source_description() const {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    return source_ ? source_->description() : "none";
}

void KeyboardHook::run_loop() {
    std::vector<KeyEvent> events;

    while (running_.load()) {
        events.clear();
        PollStatus status = source_->poll(events, POLL_TIMEOUT_MS);

        for (const auto& ev : events) {
            process_key_event(ev.code, ev.value);
        }

        if (status == PollStatus::DeviceLost) {
            // Drop the handle; the health monitor reinstalls from scratch
            Log::error(TAG, "Keyboard device lost: " + source_->description());
            source_->close();
            installed_.store(false);
            running_.store(false);
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                pressed_.clear();
            }
            break;
        }
    }
}

} // namespace netswitch
