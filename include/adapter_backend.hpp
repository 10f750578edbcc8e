#pragma once

#include "network_adapter.hpp"
#include <string>
#include <vector>

namespace netswitch {

// OS primitives for network adapters. Calls block; callers keep them off
// latency-sensitive threads.
class AdapterBackend {
public:
    virtual ~AdapterBackend() = default;

    // Fresh snapshot; returns false and fills error on failure
    virtual bool list_adapters(std::vector<NetworkAdapter>& out, std::string& error) = 0;

    // Bring the adapter administratively up or down
    virtual bool set_enabled(const std::string& device_id, bool enabled, std::string& error) = 0;
};

// /sys/class/net enumeration, SIOCSIFFLAGS toggling. Needs CAP_NET_ADMIN to change state.
class SysfsAdapterBackend : public AdapterBackend {
public:
    explicit SysfsAdapterBackend(std::string sysfs_root = "/sys/class/net");

    bool list_adapters(std::vector<NetworkAdapter>& out, std::string& error) override;
    bool set_enabled(const std::string& device_id, bool enabled, std::string& error) override;

private:
    bool read_adapter(const std::string& ifname, NetworkAdapter& adapter);

    std::string sysfs_root_;
};

} // namespace netswitch
