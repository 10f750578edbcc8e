#include "app.hpp"
#include "autostart.hpp"
#include "evdev_source.hpp"
#include "log.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <thread>
#include <chrono>
#include <unistd.h>
#include <sys/select.h>

namespace netswitch {

static constexpr const char* TAG = "app";

App::App() = default;

App::~App() {
    shutdown();
}

bool App::initialize(const std::string& config_path) {
    config_store_ = std::make_unique<ConfigStore>(config_path);

    OperationResult loaded = config_store_->load(config_);
    if (!loaded.success) {
        Log::error(TAG, loaded.message);
        return false;
    }
    Log::info(TAG, loaded.message + " (" + config_store_->path() + ")");
    apply_logging(config_.enable_logging);
    apply_startup(config_.start_with_system);

    backend_ = std::make_shared<SysfsAdapterBackend>();
    network_ = std::make_unique<NetworkAdapterService>(backend_);
    network_->set_state_changed_callback([](const NetworkAdapter& adapter) {
        show_tray_notification("Adapter", adapter.to_string());
    });

    hook_ = std::make_unique<KeyboardHook>(make_keyboard_source(config_.keyboard_device));
    hook_->update_hotkeys(config_.hotkeys);
    hook_->set_callback([this](const HotkeyConfig& hotkey) { on_hotkey(hotkey); });

    health_ = std::make_unique<HookHealthMonitor>(*hook_);
    actions_ = std::make_unique<ActionQueue>([this](HotkeyAction action) { on_action(action); });

    state_.store(AppState::Idle);
    return true;
}

void App::shutdown() {
    should_quit_.store(true);

    // Stop the producers before the consumer
    if (health_) {
        health_->stop();
    }
    if (hook_) {
        hook_->uninstall();
    }
    if (actions_) {
        actions_->stop();
    }

    health_.reset();
    hook_.reset();
    actions_.reset();
    network_.reset();
    backend_.reset();

    destroy_tray_icon();
}

int App::run() {
    actions_->start();

    // A failed install is reported but not fatal: the health monitor keeps
    // retrying while the handle is missing
    if (!hook_->install()) {
        Log::error(TAG, "Global hotkeys are unavailable until the keyboard hook can be installed");
        state_.store(AppState::Error);
    }
    health_->start();

    if (!create_tray_icon(this)) {
        Log::warn(TAG, "Failed to create tray icon");
    }
    update_tray_state(state_.load());

    std::cout << "\n=== netswitch ready ===" << std::endl;
    print_hotkeys();

    last_refresh_ = std::chrono::steady_clock::now();
    refresh_adapters();

    bool stdin_open = true;
    std::string pending;

    while (!should_quit_.load()) {
        int interval;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            interval = config_.refresh_interval;
        }
        if (interval > 0 &&
            std::chrono::steady_clock::now() - last_refresh_ >= std::chrono::seconds(interval)) {
            refresh_adapters();
        }

        if (!stdin_open) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }

        fd_set fds;
        FD_ZERO(&fds);
        FD_SET(STDIN_FILENO, &fds);

        struct timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = 100000; // 100ms timeout

        int ret = select(STDIN_FILENO + 1, &fds, nullptr, nullptr, &tv);
        if (ret <= 0) continue;

        char buf[256];
        ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
        if (n <= 0) {
            // Detached from a terminal: keep serving hotkeys only
            stdin_open = false;
            continue;
        }

        pending.append(buf, static_cast<size_t>(n));
        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            handle_command(line);
        }
    }

    return 0;
}

void App::on_hotkey(const HotkeyConfig& hotkey) {
    // Runs on the keyboard listener thread: queue and return
    Log::info(TAG, "Hotkey " + hotkey.display_text() + " -> " + action_display_name(hotkey.action));
    if (!actions_->post(hotkey.action)) {
        Log::warn(TAG, "Action queue is not running, hotkey ignored");
    }
}

void App::on_action(HotkeyAction action) {
    perform(action);
}

OperationResult App::perform(HotkeyAction action) {
    state_.store(AppState::Working);
    update_tray_state(AppState::Working);

    OperationResult result;
    switch (action) {
        case HotkeyAction::EnableAll:
            result = network_->enable_all();
            break;
        case HotkeyAction::DisableAll:
            result = network_->disable_all();
            break;
        case HotkeyAction::SwitchAdapters: {
            std::string a;
            std::string b;
            bool configured;
            {
                std::lock_guard<std::mutex> lock(config_mutex_);
                a = config_.adapter_a;
                b = config_.adapter_b;
                configured = config_.is_switch_configured();
            }
            if (!configured) {
                result = OperationResult::error(
                    "Switch adapters not configured: set adapter_a and adapter_b in " + config_store_->path());
            } else {
                result = network_->switch_adapters(a, b);
            }
            break;
        }
    }

    report(action_display_name(action), result);
    return result;
}

OperationResult App::enable_adapter(const std::string& device_id) {
    OperationResult result = network_->enable_adapter(device_id);
    report("Enable " + device_id, result);
    return result;
}

OperationResult App::disable_adapter(const std::string& device_id) {
    OperationResult result = network_->disable_adapter(device_id);
    report("Disable " + device_id, result);
    return result;
}

void App::report(const std::string& what, const OperationResult& result) {
    if (result.success) {
        Log::info(TAG, what + ": " + result.message);
    } else {
        Log::error(TAG, what + ": " + result.message);
    }
    for (const auto& detail : result.error_details) {
        Log::warn(TAG, "  " + detail);
    }

    bool notify;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        notify = config_.show_notifications;
    }
    if (notify) {
        show_tray_notification(what, result.message);
    }

    AppState next = result.success ? AppState::Idle : AppState::Error;
    state_.store(next);
    update_tray_state(next);
}

void App::print_adapters() {
    auto listing = network_->get_all_adapters();
    if (!listing.success) {
        Log::error(TAG, listing.error);
        return;
    }

    std::string a;
    std::string b;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        a = config_.adapter_a;
        b = config_.adapter_b;
    }

    std::cout << std::left << std::setw(16) << "DEVICE" << std::setw(11) << "TYPE"
              << std::setw(10) << "STATE" << std::setw(12) << "OPERSTATE" << "DESCRIPTION" << std::endl;
    for (const auto& adapter : listing.adapters) {
        std::string id = adapter.device_id;
        if (same_device_id(adapter.device_id, a)) id += " [A]";
        if (same_device_id(adapter.device_id, b)) id += " [B]";
        std::cout << std::left << std::setw(16) << id << std::setw(11) << adapter_type_name(adapter.type)
                  << std::setw(10) << adapter.status_text() << std::setw(12) << adapter.status
                  << adapter.description << std::endl;
    }
    std::cout << listing.adapters.size() << " adapter(s)" << std::endl;
}

void App::print_hotkeys() {
    std::vector<HotkeyConfig> hotkeys;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        hotkeys = config_.hotkeys;
    }

    for (const auto& hotkey : hotkeys) {
        std::cout << "  " << std::left << std::setw(20) << hotkey.display_text()
                  << action_display_name(hotkey.action);
        if (!hotkey.enabled) {
            std::cout << " (disabled)";
        } else if (!hotkey.is_valid()) {
            std::cout << " (incomplete)";
        }
        std::cout << std::endl;
    }
}

std::string App::hook_status() const {
    std::string status = health_->status();
    return status + " | Device: " + hook_->source_description();
}

bool App::reinstall_hook() {
    bool ok = health_->force_reinstall();
    AppState next = ok ? AppState::Idle : AppState::Error;
    state_.store(next);
    update_tray_state(next);
    return ok;
}

OperationResult App::reload_config() {
    ApplicationConfig fresh;
    OperationResult loaded = config_store_->load(fresh);
    if (!loaded.success) {
        return loaded;
    }

    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_ = fresh;
    }
    hook_->update_hotkeys(fresh.hotkeys);
    apply_logging(fresh.enable_logging);
    apply_startup(fresh.start_with_system);
    return loaded;
}

void App::apply_logging(bool enabled) {
    if (enabled && !Log::file_enabled()) {
        Log::enable_file(Log::default_log_path());
    } else if (!enabled && Log::file_enabled()) {
        Log::disable_file();
    }
}

void App::apply_startup(bool enabled) {
    OperationResult result = apply_autostart(enabled);
    if (!result.success) {
        Log::warn(TAG, "Autostart: " + result.message);
    }
}

void App::refresh_adapters() {
    last_refresh_ = std::chrono::steady_clock::now();

    auto listing = network_->get_all_adapters();
    if (!listing.success) {
        Log::warn(TAG, listing.error);
        return;
    }

    for (const auto& adapter : listing.adapters) {
        auto it = known_adapters_.find(adapter.device_id);
        if (it != known_adapters_.end() && it->second != adapter.enabled) {
            Log::info(TAG, adapter.to_string());
        }
        known_adapters_[adapter.device_id] = adapter.enabled;
    }
}

void App::handle_command(const std::string& line) {
    std::istringstream in(line);
    std::string command;
    std::string argument;
    in >> command >> argument;

    if (command.empty()) {
        return;
    } else if (command == "list" || command == "ls") {
        print_adapters();
    } else if (command == "enable-all") {
        actions_->post(HotkeyAction::EnableAll);
    } else if (command == "disable-all") {
        actions_->post(HotkeyAction::DisableAll);
    } else if (command == "switch") {
        actions_->post(HotkeyAction::SwitchAdapters);
    } else if (command == "enable" || command == "disable") {
        if (argument.empty()) {
            std::cerr << "Usage: " << command << " <device id>" << std::endl;
        } else if (command == "enable") {
            enable_adapter(argument);
        } else {
            disable_adapter(argument);
        }
    } else if (command == "hotkeys") {
        print_hotkeys();
    } else if (command == "status") {
        std::cout << hook_status() << std::endl;
    } else if (command == "reinstall") {
        reinstall_hook();
        std::cout << hook_status() << std::endl;
    } else if (command == "reload") {
        report("Reload configuration", reload_config());
    } else if (command == "help" || command == "?") {
        print_tray_menu();
    } else if (command == "quit" || command == "exit") {
        quit();
    } else {
        std::cerr << "Unknown command: " << command << " (type 'help')" << std::endl;
    }
}

} // namespace netswitch
