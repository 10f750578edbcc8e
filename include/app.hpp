#pragma once

#include "config.hpp"
#include "config_store.hpp"
#include "keyboard_hook.hpp"
#include "hook_health_monitor.hpp"
#include "network_service.hpp"
#include "action_queue.hpp"

#include <memory>
#include <atomic>
#include <mutex>
#include <string>
#include <chrono>
#include <map>

namespace netswitch {

enum class AppState {
    Idle,
    Working,
    Error
};

class App {
public:
    App();
    ~App();

    // Load configuration and build all components. The hook is not installed yet.
    bool initialize(const std::string& config_path = "");
    void shutdown();

    // Install the hook, start background workers and serve the console menu (blocking)
    int run();

    // Stop the application
    void quit() { should_quit_.store(true); }

    AppState state() const { return state_.load(); }

    // Actions shared by hotkeys, the console menu and one-shot commands
    OperationResult perform(HotkeyAction action);
    OperationResult enable_adapter(const std::string& device_id);
    OperationResult disable_adapter(const std::string& device_id);

    void print_adapters();
    void print_hotkeys();
    std::string hook_status() const;
    bool reinstall_hook();
    OperationResult reload_config();

private:
    void on_hotkey(const HotkeyConfig& hotkey);
    void on_action(HotkeyAction action);
    void handle_command(const std::string& line);
    void apply_logging(bool enabled);
    void apply_startup(bool enabled);
    void report(const std::string& what, const OperationResult& result);
    void refresh_adapters();

    std::unique_ptr<ConfigStore> config_store_;
    ApplicationConfig config_;
    mutable std::mutex config_mutex_;

    std::shared_ptr<AdapterBackend> backend_;
    std::unique_ptr<NetworkAdapterService> network_;
    std::unique_ptr<KeyboardHook> hook_;
    std::unique_ptr<HookHealthMonitor> health_;
    std::unique_ptr<ActionQueue> actions_;

    std::atomic<AppState> state_{AppState::Idle};
    std::atomic<bool> should_quit_{false};

    // Last seen enabled flag per adapter, for periodic refresh
    std::map<std::string, bool> known_adapters_;
    std::chrono::steady_clock::time_point last_refresh_;
};

// Console tray: state line on stdout plus the command menu
bool create_tray_icon(App* app);
void destroy_tray_icon();
void update_tray_state(AppState state);
void show_tray_notification(const std::string& title, const std::string& message);
void print_tray_menu();

} // namespace netswitch
