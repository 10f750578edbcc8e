#include "network_adapter.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace netswitch {

const char* adapter_type_name(AdapterType type) {
    switch (type) {
        case AdapterType::Ethernet: return "Ethernet";
        case AdapterType::Wireless: return "Wireless";
        case AdapterType::Bluetooth: return "Bluetooth";
        case AdapterType::Virtual: return "Virtual";
        case AdapterType::Other: return "Other";
    }
    return "Other";
}

static bool contains_any(const std::string& text, std::initializer_list<const char*> needles) {
    for (const char* needle : needles) {
        if (text.find(needle) != std::string::npos) return true;
    }
    return false;
}

AdapterType determine_adapter_type(const std::string& name, const std::string& description) {
    std::string text = name + " " + description;
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // Checked in priority order; "wlan0" must not fall through to ethernet
    if (contains_any(text, {"wi-fi", "wireless", "wlan", "802.11", "wifi", "wlp"})) {
        return AdapterType::Wireless;
    }
    if (contains_any(text, {"bluetooth", "bnep"})) {
        return AdapterType::Bluetooth;
    }
    if (contains_any(text, {"virtual", "vmware", "virtualbox", "hyper-v", "tap", "tun",
                            "vpn", "veth", "docker", "bridge", "virbr", "wireguard"})) {
        return AdapterType::Virtual;
    }
    if (contains_any(text, {"ethernet", "realtek", "intel", "gigabit", "eth", "enp", "eno", "ens"})) {
        return AdapterType::Ethernet;
    }
    return AdapterType::Other;
}

std::string NetworkAdapter::to_string() const {
    return name + " (" + adapter_type_name(type) + ") - " + status_text();
}

bool same_device_id(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool NetworkAdapter::operator==(const NetworkAdapter& other) const {
    return same_device_id(device_id, other.device_id);
}

} // namespace netswitch
