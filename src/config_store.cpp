#include "config_store.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace netswitch {

static constexpr const char* TAG = "config";

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parse_bool(const std::string& text, bool& out) {
    std::string lower = to_lower(trim(text));
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        out = true;
    } else if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        out = false;
    } else {
        return false;
    }
    return true;
}

bool parse_int(const std::string& text, int& out) {
    try {
        size_t pos = 0;
        int value = std::stoi(trim(text), &pos);
        if (pos != trim(text).size()) return false;
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_double(const std::string& text, double& out) {
    try {
        size_t pos = 0;
        double value = std::stod(trim(text), &pos);
        if (pos != trim(text).size()) return false;
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// "3, SwitchAdapters, Ctrl+Alt+Shift, S, true"
bool parse_hotkey(const std::string& text, HotkeyConfig& out) {
    std::vector<std::string> fields;
    std::istringstream stream(text);
    std::string field;
    while (std::getline(stream, field, ',')) {
        fields.push_back(trim(field));
    }
    if (fields.size() != 5) return false;

    HotkeyConfig hotkey;
    if (!parse_int(fields[0], hotkey.id)) return false;
    if (!action_from_name(fields[1], hotkey.action)) return false;
    if (!parse_modifiers(fields[2], hotkey.modifiers)) return false;
    hotkey.key = key_from_name(fields[3]);
    if (hotkey.key == Key::None && to_lower(fields[3]) != "none") return false;
    if (!parse_bool(fields[4], hotkey.enabled)) return false;

    out = hotkey;
    return true;
}

const char* bool_text(bool value) {
    return value ? "true" : "false";
}

} // namespace

ConfigStore::ConfigStore(std::string path)
    : path_(path.empty() ? default_config_path() : std::move(path)) {
}

std::string ConfigStore::default_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "netswitch.conf";
    return std::string(home) + "/.netswitch/config.conf";
}

bool ConfigStore::exists() const {
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

void ConfigStore::parse(std::istream& in, ApplicationConfig& out, std::vector<std::string>& warnings) {
    bool hotkeys_seen = false;
    std::string line;
    int line_number = 0;

    while (std::getline(in, line)) {
        ++line_number;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            warnings.push_back("Line " + std::to_string(line_number) + ": expected key = value");
            continue;
        }

        std::string key = to_lower(trim(line.substr(0, eq)));
        std::string value = trim(line.substr(eq + 1));
        bool ok = true;

        if (key == "hotkey") {
            HotkeyConfig hotkey;
            ok = parse_hotkey(value, hotkey);
            if (ok) {
                if (!hotkeys_seen) {
                    out.hotkeys.clear();
                    hotkeys_seen = true;
                }
                out.hotkeys.push_back(hotkey);
            }
        } else if (key == "adapter_a") {
            out.adapter_a = value;
        } else if (key == "adapter_b") {
            out.adapter_b = value;
        } else if (key == "keyboard_device") {
            out.keyboard_device = value;
        } else if (key == "window_x") {
            ok = parse_double(value, out.window.x);
        } else if (key == "window_y") {
            ok = parse_double(value, out.window.y);
        } else if (key == "window_width") {
            ok = parse_double(value, out.window.width);
        } else if (key == "window_height") {
            ok = parse_double(value, out.window.height);
        } else if (key == "start_with_system") {
            ok = parse_bool(value, out.start_with_system);
        } else if (key == "minimize_to_tray") {
            ok = parse_bool(value, out.minimize_to_tray);
        } else if (key == "minimize_to_tray_on_close") {
            ok = parse_bool(value, out.minimize_to_tray_on_close);
        } else if (key == "show_notifications") {
            ok = parse_bool(value, out.show_notifications);
        } else if (key == "enable_logging") {
            ok = parse_bool(value, out.enable_logging);
        } else if (key == "refresh_interval") {
            ok = parse_int(value, out.refresh_interval);
        } else {
            warnings.push_back("Line " + std::to_string(line_number) + ": unknown setting '" + key + "'");
            continue;
        }

        if (!ok) {
            warnings.push_back("Line " + std::to_string(line_number) + ": invalid value for " +
                               key + ": '" + value + "'");
        }
    }
}

std::string ConfigStore::serialize(const ApplicationConfig& config) {
    std::ostringstream out;

    out << "# netswitch configuration\n"
        << "# hotkey = id, action, modifiers, key, enabled\n"
        << "#   action: EnableAll, DisableAll, SwitchAdapters\n"
        << "#   modifiers: Ctrl, Alt, Shift, Win joined with '+'\n\n";

    for (const auto& hotkey : config.hotkeys) {
        out << "hotkey = " << hotkey.id << ", " << action_name(hotkey.action) << ", "
            << modifiers_to_string(hotkey.modifiers) << ", " << key_name(hotkey.key) << ", "
            << bool_text(hotkey.enabled) << "\n";
    }

    out << "\n# Adapters toggled by SwitchAdapters (interface names)\n"
        << "adapter_a = " << config.adapter_a << "\n"
        << "adapter_b = " << config.adapter_b << "\n\n"
        << "# Keyboard device for the hotkey listener, empty for auto-detect\n"
        << "keyboard_device = " << config.keyboard_device << "\n\n"
        << "window_x = " << config.window.x << "\n"
        << "window_y = " << config.window.y << "\n"
        << "window_width = " << config.window.width << "\n"
        << "window_height = " << config.window.height << "\n\n"
        << "start_with_system = " << bool_text(config.start_with_system) << "\n"
        << "minimize_to_tray = " << bool_text(config.minimize_to_tray) << "\n"
        << "minimize_to_tray_on_close = " << bool_text(config.minimize_to_tray_on_close) << "\n"
        << "show_notifications = " << bool_text(config.show_notifications) << "\n"
        << "enable_logging = " << bool_text(config.enable_logging) << "\n"
        << "refresh_interval = " << config.refresh_interval << "\n";

    return out.str();
}

bool ConfigStore::ensure_directory(std::string& error) const {
    auto parent = std::filesystem::path(path_).parent_path();
    if (parent.empty()) return true;

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        error = "Cannot create " + parent.string() + ": " + ec.message();
        return false;
    }
    return true;
}

void ConfigStore::create_backup() const {
    if (!exists()) return;

    std::error_code ec;
    std::filesystem::copy_file(path_, backup_path(),
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        // The save itself still goes ahead
        Log::warn(TAG, "Failed to back up configuration: " + ec.message());
    }
}

OperationResult ConfigStore::load(ApplicationConfig& out) {
    if (!exists()) {
        ApplicationConfig defaults;
        OperationResult saved = save(defaults);
        if (!saved.success) {
            return OperationResult::error("Failed to create default configuration: " + saved.message,
                                          saved.error_details);
        }
        out = defaults;
        return OperationResult::ok("Created default configuration at " + path_);
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        return OperationResult::error("Cannot read configuration file " + path_);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    if (trim(content).empty()) {
        out = ApplicationConfig();
        return OperationResult::ok("Configuration file is empty, using defaults");
    }

    ApplicationConfig config;
    std::vector<std::string> problems;
    std::istringstream in(content);
    parse(in, config, problems);

    for (const auto& error : config.validate()) {
        problems.push_back(error);
    }

    out = config;

    if (!problems.empty()) {
        std::string message = "Configuration loaded with " + std::to_string(problems.size()) + " problem(s)";
        for (const auto& problem : problems) {
            Log::warn(TAG, problem);
        }
        return OperationResult::warning(message, problems);
    }
    return OperationResult::ok("Configuration loaded");
}

OperationResult ConfigStore::save(const ApplicationConfig& config) {
    auto errors = config.validate();
    if (!errors.empty()) {
        std::string message = "Configuration is invalid: " + errors.front();
        return OperationResult::error(message, errors);
    }

    std::string error;
    if (!ensure_directory(error)) {
        return OperationResult::error(error);
    }

    create_backup();

    std::ofstream file(path_, std::ios::trunc);
    if (!file.is_open()) {
        return OperationResult::error("Cannot write configuration file " + path_);
    }
    file << serialize(config);
    file.flush();
    if (!file) {
        return OperationResult::error("Failed while writing configuration file " + path_);
    }

    Log::info(TAG, "Configuration saved to " + path_);
    return OperationResult::ok("Configuration saved");
}

OperationResult ConfigStore::reset_to_default(ApplicationConfig& out) {
    ApplicationConfig defaults;
    OperationResult saved = save(defaults);
    if (!saved.success) {
        return OperationResult::error("Failed to reset configuration: " + saved.message);
    }
    out = defaults;
    return OperationResult::ok("Configuration reset to defaults");
}

OperationResult ConfigStore::export_to(const std::string& path) {
    if (trim(path).empty()) {
        return OperationResult::error("Export path must not be empty");
    }

    ApplicationConfig config;
    OperationResult loaded = load(config);
    if (!loaded.success) {
        return OperationResult::error("Failed to load current configuration: " + loaded.message);
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return OperationResult::error("Cannot write " + path);
    }
    file << serialize(config);
    if (!file) {
        return OperationResult::error("Failed while writing " + path);
    }
    return OperationResult::ok("Configuration exported to " + path);
}

OperationResult ConfigStore::import_from(const std::string& path, ApplicationConfig& out) {
    if (trim(path).empty()) {
        return OperationResult::error("Import path must not be empty");
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return OperationResult::error("Import file does not exist: " + path);
    }

    ApplicationConfig config;
    std::vector<std::string> problems;
    parse(file, config, problems);
    if (!problems.empty()) {
        return OperationResult::error("Import file is malformed", problems);
    }

    auto errors = config.validate();
    if (!errors.empty()) {
        return OperationResult::error("Imported configuration is invalid", errors);
    }

    OperationResult saved = save(config);
    if (!saved.success) {
        return OperationResult::error("Failed to save imported configuration: " + saved.message);
    }
    out = config;
    return OperationResult::ok("Configuration imported");
}

OperationResult ConfigStore::restore_backup() {
    std::error_code ec;
    if (!std::filesystem::exists(backup_path(), ec)) {
        return OperationResult::error("No configuration backup found");
    }

    std::filesystem::copy_file(backup_path(), path_,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return OperationResult::error("Failed to restore backup: " + ec.message());
    }
    return OperationResult::ok("Configuration restored from backup");
}

} // namespace netswitch
