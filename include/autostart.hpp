#pragma once

#include "operation_result.hpp"
#include <string>

namespace netswitch {

// Login autostart through an XDG desktop entry
// ($XDG_CONFIG_HOME/autostart/netswitch.desktop, ~/.config/autostart if unset).

// Full path of the autostart entry
std::string autostart_entry_path();

// Resolved path of the running binary (/proc/self/exe), empty if unknown
std::string current_executable_path();

// Write (enable) or remove (disable) the entry. exec_path defaults to the
// running binary. Removing a missing entry succeeds.
OperationResult set_autostart(bool enable, const std::string& exec_path = "");

// Entry exists and has a non-empty Exec line
bool is_autostart_enabled();

// Exec path stored in the entry, empty if there is none
std::string autostart_exec_path();

// Entry exists and points at exec_path (the running binary by default)
bool autostart_path_matches(const std::string& exec_path = "");

// Rewrite an enabled entry whose Exec no longer points at exec_path
OperationResult fix_autostart_path(const std::string& exec_path = "");

// Bring the entry in line with the start_with_system setting
OperationResult apply_autostart(bool enable, const std::string& exec_path = "");

} // namespace netswitch
