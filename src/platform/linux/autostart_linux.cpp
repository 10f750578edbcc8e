#include "autostart.hpp"
#include "log.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <unistd.h>

namespace netswitch {

static constexpr const char* TAG = "app";
static constexpr const char* ENTRY_NAME = "netswitch.desktop";

namespace fs = std::filesystem;

std::string autostart_entry_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return (fs::path(xdg) / "autostart" / ENTRY_NAME).string();
    }
    const char* home = std::getenv("HOME");
    fs::path base = home ? fs::path(home) / ".config" : fs::path("/tmp");
    return (base / "autostart" / ENTRY_NAME).string();
}

std::string current_executable_path() {
    char buffer[4096];
    ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (len <= 0) return "";
    buffer[len] = '\0';
    return buffer;
}

static std::string resolve_exec(const std::string& exec_path) {
    return exec_path.empty() ? current_executable_path() : exec_path;
}

// Desktop entry Exec values quote paths with spaces
static std::string quote_exec(const std::string& path) {
    if (path.find_first_of(" \t\"") == std::string::npos) return path;
    std::string out = "\"";
    for (char c : path) {
        if (c == '"' || c == '\\' || c == '`' || c == '$') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

static std::string unquote_exec(const std::string& value) {
    if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
        // Unquoted: the program is the first word
        return value.substr(0, value.find(' '));
    }
    std::string out;
    for (size_t i = 1; i + 1 < value.size(); ++i) {
        if (value[i] == '\\' && i + 2 < value.size()) ++i;
        out += value[i];
    }
    return out;
}

OperationResult set_autostart(bool enable, const std::string& exec_path) {
    const std::string entry = autostart_entry_path();
    std::error_code ec;

    if (!enable) {
        if (!fs::exists(entry, ec)) {
            return OperationResult::ok("Autostart already disabled");
        }
        if (!fs::remove(entry, ec) || ec) {
            return OperationResult::error("Cannot remove " + entry + ": " + ec.message());
        }
        Log::info(TAG, "Autostart entry removed: " + entry);
        return OperationResult::ok("Removed from login autostart");
    }

    std::string exec = resolve_exec(exec_path);
    if (exec.empty()) {
        return OperationResult::error("Cannot determine the program path");
    }

    fs::create_directories(fs::path(entry).parent_path(), ec);
    if (ec) {
        return OperationResult::error("Cannot create " + fs::path(entry).parent_path().string() +
                                      ": " + ec.message());
    }

    std::ofstream file(entry, std::ios::trunc);
    if (!file) {
        return OperationResult::error("Cannot write " + entry);
    }
    file << "[Desktop Entry]\n"
         << "Type=Application\n"
         << "Name=netswitch\n"
         << "Comment=Network adapter hotkeys\n"
         << "Exec=" << quote_exec(exec) << "\n"
         << "Terminal=false\n"
         << "X-GNOME-Autostart-enabled=true\n";
    file.close();
    if (!file) {
        return OperationResult::error("Cannot write " + entry);
    }

    Log::info(TAG, "Autostart entry written: " + entry);
    return OperationResult::ok("Added to login autostart");
}

std::string autostart_exec_path() {
    std::ifstream file(autostart_entry_path());
    if (!file) return "";

    std::string line;
    while (std::getline(file, line)) {
        if (line.compare(0, 5, "Exec=") == 0) {
            return unquote_exec(line.substr(5));
        }
    }
    return "";
}

bool is_autostart_enabled() {
    return !autostart_exec_path().empty();
}

bool autostart_path_matches(const std::string& exec_path) {
    std::string stored = autostart_exec_path();
    std::string exec = resolve_exec(exec_path);
    if (stored.empty() || exec.empty()) return false;

    // Compare resolved files so a symlinked install still matches
    std::error_code ec;
    if (fs::equivalent(stored, exec, ec) && !ec) return true;
    return stored == exec;
}

OperationResult fix_autostart_path(const std::string& exec_path) {
    if (!is_autostart_enabled()) {
        return OperationResult::info("Autostart is not enabled, nothing to fix");
    }
    if (autostart_path_matches(exec_path)) {
        return OperationResult::info("Autostart path is up to date");
    }
    Log::warn(TAG, "Autostart entry points at " + autostart_exec_path() + ", rewriting");
    return set_autostart(true, exec_path);
}

OperationResult apply_autostart(bool enable, const std::string& exec_path) {
    if (!enable) {
        return set_autostart(false, exec_path);
    }
    if (!is_autostart_enabled()) {
        return set_autostart(true, exec_path);
    }
    return fix_autostart_path(exec_path);
}

} // namespace netswitch
