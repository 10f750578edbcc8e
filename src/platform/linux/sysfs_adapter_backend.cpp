#include "adapter_backend.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <net/if.h>
#include <net/if_arp.h>
#include <sys/ioctl.h>
#include <sys/socket.h>

namespace fs = std::filesystem;

namespace netswitch {

// First line of a sysfs attribute, empty if unreadable
static std::string read_attribute(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) return "";
    std::string line;
    std::getline(file, line);
    size_t end = line.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? "" : line.substr(0, end + 1);
}

static std::string driver_name(const fs::path& iface_dir) {
    std::error_code ec;
    fs::path driver = fs::read_symlink(iface_dir / "device" / "driver", ec);
    if (ec) return "";
    return driver.filename().string();
}

SysfsAdapterBackend::SysfsAdapterBackend(std::string sysfs_root)
    : sysfs_root_(std::move(sysfs_root)) {
}

bool SysfsAdapterBackend::read_adapter(const std::string& ifname, NetworkAdapter& adapter) {
    fs::path dir = fs::path(sysfs_root_) / ifname;
    std::error_code ec;

    int arp_type = 0;
    try {
        arp_type = std::stoi(read_attribute(dir / "type"));
    } catch (const std::exception&) {
        return false;
    }
    if (arp_type == ARPHRD_LOOPBACK) return false;

    unsigned long flags = 0;
    try {
        flags = std::stoul(read_attribute(dir / "flags"), nullptr, 16);
    } catch (const std::exception&) {
        return false;
    }

    adapter.device_id = ifname;
    adapter.name = ifname;
    adapter.friendly_name = read_attribute(dir / "ifalias");

    std::string driver = driver_name(dir);
    adapter.description = driver.empty() ? "virtual interface" : driver + " driver";

    bool physical = fs::exists(dir / "device", ec);
    if (fs::exists(dir / "wireless", ec) || fs::exists(dir / "phy80211", ec)) {
        adapter.type = AdapterType::Wireless;
    } else if (fs::exists(dir / "bridge", ec) || fs::exists(dir / "tun_flags", ec)) {
        adapter.type = AdapterType::Virtual;
    } else {
        adapter.type = determine_adapter_type(adapter.name, driver);
        if (adapter.type == AdapterType::Other) {
            if (!physical) {
                adapter.type = AdapterType::Virtual;
            } else if (arp_type == ARPHRD_ETHER) {
                adapter.type = AdapterType::Ethernet;
            }
        }
    }

    adapter.enabled = (flags & IFF_UP) != 0;
    adapter.status = read_attribute(dir / "operstate");
    if (adapter.status.empty()) adapter.status = "unknown";
    adapter.last_updated = std::chrono::system_clock::now();
    return true;
}

bool SysfsAdapterBackend::list_adapters(std::vector<NetworkAdapter>& out, std::string& error) {
    std::error_code ec;
    fs::directory_iterator it(sysfs_root_, ec);
    if (ec) {
        error = "Cannot read " + sysfs_root_ + ": " + ec.message();
        return false;
    }

    for (const auto& entry : it) {
        NetworkAdapter adapter;
        if (read_adapter(entry.path().filename().string(), adapter)) {
            out.push_back(adapter);
        }
    }
    return true;
}

bool SysfsAdapterBackend::set_enabled(const std::string& device_id, bool enabled, std::string& error) {
    if (device_id.empty() || device_id.size() >= IFNAMSIZ) {
        error = "Invalid interface name: " + device_id;
        return false;
    }

    int sock = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (sock < 0) {
        error = std::string("socket() failed: ") + std::strerror(errno);
        return false;
    }

    struct ifreq ifr;
    std::memset(&ifr, 0, sizeof(ifr));
    std::strncpy(ifr.ifr_name, device_id.c_str(), IFNAMSIZ - 1);

    if (ioctl(sock, SIOCGIFFLAGS, &ifr) < 0) {
        error = "SIOCGIFFLAGS " + device_id + ": " + std::strerror(errno);
        close(sock);
        return false;
    }

    if (enabled) {
        ifr.ifr_flags |= IFF_UP;
    } else {
        ifr.ifr_flags &= ~IFF_UP;
    }

    if (ioctl(sock, SIOCSIFFLAGS, &ifr) < 0) {
        error = "SIOCSIFFLAGS " + device_id + ": " + std::strerror(errno);
        close(sock);
        return false;
    }

    close(sock);
    return true;
}

} // namespace netswitch
