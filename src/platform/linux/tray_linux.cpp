#include "app.hpp"
#include <iostream>

// Linux tray - console rendition without GUI dependencies.
// State changes print a status line, the menu is typed on stdin.

namespace netswitch {

static App* g_app = nullptr;

bool create_tray_icon(App* app) {
    g_app = app;
    print_tray_menu();
    return true;
}

void destroy_tray_icon() {
    g_app = nullptr;
}

void update_tray_state(AppState state) {
    if (!g_app) return;

    const char* state_str = "";
    switch (state) {
        case AppState::Idle:
            state_str = "Ready";
            break;
        case AppState::Working:
            state_str = "Working...";
            break;
        case AppState::Error:
            state_str = "Error";
            break;
    }
    std::cout << "[netswitch] " << state_str << std::endl;
}

void show_tray_notification(const std::string& title, const std::string& message) {
    if (!g_app) return;
    std::cout << "[netswitch] " << title << ": " << message << std::endl;
}

void print_tray_menu() {
    std::cout << "Commands:\n"
              << "  list             Show network adapters\n"
              << "  enable-all       Enable every adapter\n"
              << "  disable-all      Disable every adapter\n"
              << "  switch           Toggle between adapter A and B\n"
              << "  enable <id>      Enable one adapter\n"
              << "  disable <id>     Disable one adapter\n"
              << "  hotkeys          Show configured hotkeys\n"
              << "  status           Show keyboard hook status\n"
              << "  reinstall        Reinstall the keyboard hook\n"
              << "  reload           Re-read the configuration file\n"
              << "  help             Show this menu\n"
              << "  quit             Exit\n"
              << std::endl;
}

} // namespace netswitch
