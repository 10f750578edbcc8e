#pragma once

#include "config.hpp"
#include "operation_result.hpp"
#include <istream>
#include <string>
#include <vector>

namespace netswitch {

// Loads and saves ApplicationConfig as a line-based text file:
//
//   # comment
//   adapter_a = wlan0
//   refresh_interval = 60
//   hotkey = 3, SwitchAdapters, Ctrl+Alt+Shift, S, true
//
// Any hotkey line replaces the default hotkey list as a whole.
class ConfigStore {
public:
    // Empty path: ~/.netswitch/config.conf
    explicit ConfigStore(std::string path = "");

    // Missing file: defaults are written and returned. Empty file: defaults.
    // Unreadable lines and validation problems give a Warning carrying the loaded config.
    OperationResult load(ApplicationConfig& out);

    // Rejects configs that fail validate(); keeps the previous file as <path>.backup
    OperationResult save(const ApplicationConfig& config);

    OperationResult reset_to_default(ApplicationConfig& out);
    OperationResult export_to(const std::string& path);
    OperationResult import_from(const std::string& path, ApplicationConfig& out);
    OperationResult restore_backup();

    bool exists() const;
    const std::string& path() const { return path_; }
    std::string backup_path() const { return path_ + ".backup"; }

    static std::string default_config_path();

    // Parse config text into out (which should hold defaults); problems go to warnings
    static void parse(std::istream& in, ApplicationConfig& out, std::vector<std::string>& warnings);
    static std::string serialize(const ApplicationConfig& config);

private:
    bool ensure_directory(std::string& error) const;
    void create_backup() const;

    std::string path_;
};

} // namespace netswitch
