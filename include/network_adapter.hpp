#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace netswitch {

// Order matters: adapter lists are sorted by type first
enum class AdapterType {
    Ethernet,
    Wireless,
    Bluetooth,
    Virtual,
    Other
};

const char* adapter_type_name(AdapterType type);

// Guess the adapter type from its name and description (keyword based)
AdapterType determine_adapter_type(const std::string& name, const std::string& description);

struct NetworkAdapter {
    std::string device_id;      // Unique, compared case-insensitively
    std::string name;
    std::string description;
    std::string friendly_name;
    AdapterType type = AdapterType::Other;
    bool enabled = false;
    std::string status;
    std::chrono::system_clock::time_point last_updated;

    const char* status_text() const { return enabled ? "Enabled" : "Disabled"; }

    // "eth0 (Ethernet) - Enabled"
    std::string to_string() const;

    bool operator==(const NetworkAdapter& other) const;
    bool operator!=(const NetworkAdapter& other) const { return !(*this == other); }
};

// Case-insensitive device id comparison
bool same_device_id(const std::string& a, const std::string& b);

} // namespace netswitch
