#include "app.hpp"
#include "config_store.hpp"
#include "instance_lock.hpp"
#include <iostream>
#include <csignal>
#include <cstring>

static netswitch::App* g_app = nullptr;

void signal_handler(int signum) {
    std::cout << "\nReceived signal " << signum << ", shutting down..." << std::endl;
    if (g_app) {
        g_app->quit();
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config PATH   Configuration file (default: ~/.netswitch/config.conf)\n"
              << "  -l, --list          List network adapters and exit\n"
              << "  --enable-all        Enable every adapter and exit\n"
              << "  --disable-all       Disable every adapter and exit\n"
              << "  --switch            Toggle between adapter A and B and exit\n"
              << "  --enable ID         Enable one adapter and exit\n"
              << "  --disable ID        Disable one adapter and exit\n"
              << "  --init-config       Write the default configuration and exit\n"
              << "  -h, --help          Show this help\n"
              << "\nWithout a command the hotkey listener runs until Ctrl+C or 'quit'.\n"
              << "\nDefault hotkeys:\n"
              << "  Ctrl + Alt + Shift + E   Enable all adapters\n"
              << "  Ctrl + Alt + Shift + D   Disable all adapters\n"
              << "  Ctrl + Alt + Shift + S   Switch between adapter A and B\n"
              << "\nPermissions:\n"
              << "  Reading /dev/input needs the 'input' group, changing adapters needs CAP_NET_ADMIN:\n"
              << "    sudo usermod -aG input $USER\n"
              << "    sudo setcap cap_net_admin+ep ./netswitch\n"
              << std::endl;
}

enum class Command {
    Run,
    List,
    EnableAll,
    DisableAll,
    Switch,
    Enable,
    Disable,
    InitConfig
};

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string device_id;
    Command command = Command::Run;
    int commands = 0;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        else if ((strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        }
        else if (strcmp(argv[i], "-l") == 0 || strcmp(argv[i], "--list") == 0) {
            command = Command::List;
            ++commands;
        }
        else if (strcmp(argv[i], "--enable-all") == 0) {
            command = Command::EnableAll;
            ++commands;
        }
        else if (strcmp(argv[i], "--disable-all") == 0) {
            command = Command::DisableAll;
            ++commands;
        }
        else if (strcmp(argv[i], "--switch") == 0) {
            command = Command::Switch;
            ++commands;
        }
        else if (strcmp(argv[i], "--enable") == 0 && i + 1 < argc) {
            command = Command::Enable;
            device_id = argv[++i];
            ++commands;
        }
        else if (strcmp(argv[i], "--disable") == 0 && i + 1 < argc) {
            command = Command::Disable;
            device_id = argv[++i];
            ++commands;
        }
        else if (strcmp(argv[i], "--init-config") == 0) {
            command = Command::InitConfig;
            ++commands;
        }
        else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (commands > 1) {
        std::cerr << "Only one command may be given at a time" << std::endl;
        return 1;
    }

    if (command == Command::InitConfig) {
        netswitch::ConfigStore store(config_path);
        netswitch::ApplicationConfig config;
        auto result = store.reset_to_default(config);
        std::cout << result.message << ": " << store.path() << std::endl;
        return result.success ? 0 : 1;
    }

    netswitch::App app;
    if (!app.initialize(config_path)) {
        std::cerr << "Failed to initialize application" << std::endl;
        return 1;
    }

    netswitch::OperationResult result;
    switch (command) {
        case Command::List:
            app.print_adapters();
            return 0;
        case Command::EnableAll:
            result = app.perform(netswitch::HotkeyAction::EnableAll);
            return result.success ? 0 : 1;
        case Command::DisableAll:
            result = app.perform(netswitch::HotkeyAction::DisableAll);
            return result.success ? 0 : 1;
        case Command::Switch:
            result = app.perform(netswitch::HotkeyAction::SwitchAdapters);
            return result.success ? 0 : 1;
        case Command::Enable:
            result = app.enable_adapter(device_id);
            return result.success ? 0 : 1;
        case Command::Disable:
            result = app.disable_adapter(device_id);
            return result.success ? 0 : 1;
        case Command::Run:
        case Command::InitConfig:
            break;
    }

    netswitch::InstanceLock lock;
    if (!lock.acquire()) {
        std::cerr << "netswitch is already running (lock: " << lock.path() << ")" << std::endl;
        return 1;
    }

    // Setup signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    g_app = &app;

    std::cout << "netswitch - Network adapter hotkeys\n" << std::endl;

    int exit_code = app.run();

    g_app = nullptr;
    app.shutdown();
    return exit_code;
}
