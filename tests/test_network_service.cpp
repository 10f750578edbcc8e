// Automated tests for NetworkAdapterService

#include "network_service.hpp"
#include "log.hpp"
#include "fakes.hpp"
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <map>
#include <unistd.h>

using namespace netswitch;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

struct Fixture {
    std::shared_ptr<FakeAdapterBackend> backend = std::make_shared<FakeAdapterBackend>();
    NetworkAdapterService service{backend, 250ms, [this](std::chrono::milliseconds delay) {
        backend->calls.push_back("sleep " + std::to_string(delay.count()));
    }};
};

void test_list_sorted_by_type_then_name() {
    std::cout << "Testing adapter listing order..." << std::endl;

    Fixture f;
    f.backend->add("wlan1", AdapterType::Wireless, true);
    f.backend->add("virbr0", AdapterType::Virtual, true);
    f.backend->add("wlan0", AdapterType::Wireless, false);
    f.backend->add("eth0", AdapterType::Ethernet, true);

    auto listing = f.service.get_all_adapters();
    assert(listing.success);
    assert(listing.adapters.size() == 4);
    assert(listing.adapters[0].device_id == "eth0");
    assert(listing.adapters[1].device_id == "wlan0");
    assert(listing.adapters[2].device_id == "wlan1");
    assert(listing.adapters[3].device_id == "virbr0");

    f.backend->list_fails = true;
    listing = f.service.get_all_adapters();
    assert(!listing.success);
    assert(listing.adapters.empty());
    assert(listing.error.find("enumeration failed") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_enable_disable_single() {
    std::cout << "Testing single adapter enable/disable..." << std::endl;

    Fixture f;
    f.backend->add("eth0", AdapterType::Ethernet, false);

    std::vector<std::string> notified;
    f.service.set_state_changed_callback([&notified](const NetworkAdapter& adapter) {
        notified.push_back(adapter.to_string());
    });

    // Device ids match case-insensitively
    auto result = f.service.enable_adapter("ETH0");
    assert(result.success);
    assert(f.backend->is_enabled("eth0"));
    assert(notified.size() == 1 && notified[0] == "eth0 (Ethernet) - Enabled");

    result = f.service.disable_adapter("eth0");
    assert(result.success);
    assert(!f.backend->is_enabled("eth0"));

    result = f.service.enable_adapter("missing0");
    assert(!result.success);
    assert(result.message == "Network adapter not found: missing0");

    result = f.service.enable_adapter("");
    assert(!result.success);

    f.backend->failing.insert("eth0");
    result = f.service.enable_adapter("eth0");
    assert(!result.success);
    assert(result.type == ResultType::Error);
    assert(result.message.find("permission denied") != std::string::npos);
    assert(notified.size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_switch_a_to_b() {
    std::cout << "Testing switch from A to B..." << std::endl;

    Fixture f;
    f.backend->add("wlan0", AdapterType::Wireless, true);
    f.backend->add("eth0", AdapterType::Ethernet, false);

    auto result = f.service.switch_adapters("wlan0", "eth0");
    assert(result.success);

    std::vector<std::string> expected = {"disable wlan0", "sleep 250", "enable eth0"};
    assert(f.backend->calls == expected);
    assert(!f.backend->is_enabled("wlan0"));
    assert(f.backend->is_enabled("eth0"));

    std::cout << "  PASS" << std::endl;
}

void test_switch_b_to_a() {
    std::cout << "Testing switch from B to A..." << std::endl;

    Fixture f;
    f.backend->add("wlan0", AdapterType::Wireless, false);
    f.backend->add("eth0", AdapterType::Ethernet, true);

    auto result = f.service.switch_adapters("wlan0", "eth0");
    assert(result.success);

    std::vector<std::string> expected = {"disable eth0", "sleep 250", "enable wlan0"};
    assert(f.backend->calls == expected);

    std::cout << "  PASS" << std::endl;
}

void test_switch_both_off_enables_a() {
    std::cout << "Testing switch with both adapters off..." << std::endl;

    Fixture f;
    f.backend->add("wlan0", AdapterType::Wireless, false);
    f.backend->add("eth0", AdapterType::Ethernet, false);

    auto result = f.service.switch_adapters("wlan0", "eth0");
    assert(result.success);

    std::vector<std::string> expected = {"enable wlan0"};
    assert(f.backend->calls == expected);

    std::cout << "  PASS" << std::endl;
}

void test_switch_both_on_takes_a_branch() {
    std::cout << "Testing switch with both adapters on..." << std::endl;

    Fixture f;
    f.backend->add("wlan0", AdapterType::Wireless, true);
    f.backend->add("eth0", AdapterType::Ethernet, true);

    auto result = f.service.switch_adapters("wlan0", "eth0");
    assert(result.success);

    std::vector<std::string> expected = {"disable wlan0", "sleep 250", "enable eth0"};
    assert(f.backend->calls == expected);
    assert(!f.backend->is_enabled("wlan0"));
    assert(f.backend->is_enabled("eth0"));

    std::cout << "  PASS" << std::endl;
}

void test_switch_failures() {
    std::cout << "Testing switch failures..." << std::endl;

    Fixture f;
    f.backend->add("wlan0", AdapterType::Wireless, true);
    f.backend->add("eth0", AdapterType::Ethernet, false);

    auto result = f.service.switch_adapters("wlan0", "wlan0");
    assert(!result.success);
    assert(result.message == "Cannot switch between the same adapter");

    result = f.service.switch_adapters("WLAN0", "wlan0");
    assert(!result.success);

    result = f.service.switch_adapters("", "eth0");
    assert(!result.success);

    result = f.service.switch_adapters("wlan0", "eth9");
    assert(!result.success);
    assert(result.message.find("eth9") != std::string::npos);
    assert(f.backend->calls.empty());

    // Enable step fails: still disabled A, no rollback
    f.backend->failing.insert("eth0");
    result = f.service.switch_adapters("wlan0", "eth0");
    assert(!result.success);
    assert(result.message == "Adapter switch failed");
    assert(result.error_details.size() == 1);
    std::vector<std::string> expected = {"disable wlan0", "sleep 250", "enable eth0"};
    assert(f.backend->calls == expected);
    assert(!f.backend->is_enabled("wlan0"));

    std::cout << "  PASS" << std::endl;
}

void test_enable_all_partial_failure() {
    std::cout << "Testing enable all with partial failure..." << std::endl;

    Fixture f;
    f.backend->add("eth0", AdapterType::Ethernet, false);
    f.backend->add("eth1", AdapterType::Ethernet, false);
    f.backend->add("wlan0", AdapterType::Wireless, false);
    f.backend->add("wlan1", AdapterType::Wireless, false);
    f.backend->add("bnep0", AdapterType::Bluetooth, false);
    f.backend->failing = {"eth1", "wlan1", "bnep0"};

    auto result = f.service.enable_all();
    assert(result.success);
    assert(result.type == ResultType::Warning);
    assert(result.succeeded == 2);
    assert(result.failed == 3);
    assert(result.error_details.size() == 3);
    assert(result.message == "Partially succeeded: 2 enabled, 3 failed");

    std::cout << "  PASS" << std::endl;
}

void test_batch_outcomes() {
    std::cout << "Testing batch outcomes..." << std::endl;

    Fixture f;
    f.backend->add("eth0", AdapterType::Ethernet, true);
    f.backend->add("wlan0", AdapterType::Wireless, false);

    // Only adapters not already in the target state are touched
    auto result = f.service.enable_all();
    assert(result.success);
    assert(result.type == ResultType::Success);
    assert(result.succeeded == 1 && result.failed == 0);
    std::vector<std::string> expected = {"enable wlan0"};
    assert(f.backend->calls == expected);

    f.backend->calls.clear();
    f.backend->failing = {"eth0", "wlan0"};
    result = f.service.disable_all();
    assert(!result.success);
    assert(result.type == ResultType::Error);
    assert(result.succeeded == 0 && result.failed == 2);
    assert(result.error_details.size() == 2);

    f.backend->failing.clear();
    result = f.service.disable_all();
    assert(result.success);
    assert(result.message == "Disabled 2 adapter(s)");

    // Nothing left to do
    result = f.service.disable_all();
    assert(result.success);
    assert(result.succeeded == 0);

    f.backend->list_fails = true;
    result = f.service.enable_all();
    assert(!result.success);

    std::cout << "  PASS" << std::endl;
}

void test_adapter_type_guess() {
    std::cout << "Testing adapter type heuristics..." << std::endl;

    assert(determine_adapter_type("wlan0", "") == AdapterType::Wireless);
    assert(determine_adapter_type("Wi-Fi", "Intel Wireless-AC 9560") == AdapterType::Wireless);
    assert(determine_adapter_type("bnep0", "") == AdapterType::Bluetooth);
    assert(determine_adapter_type("docker0", "") == AdapterType::Virtual);
    assert(determine_adapter_type("enp3s0", "") == AdapterType::Ethernet);
    assert(determine_adapter_type("Local Area Connection", "Realtek PCIe GbE") == AdapterType::Ethernet);
    assert(determine_adapter_type("can0", "") == AdapterType::Other);

    assert(same_device_id("ETH0", "eth0"));
    assert(!same_device_id("eth0", "eth01"));

    std::cout << "  PASS" << std::endl;
}

static void write_attribute(const fs::path& dir, const std::string& name, const std::string& value) {
    std::ofstream file(dir / name, std::ios::trunc);
    file << value << "\n";
}

// Builds /sys/class/net/<ifname> with the attributes the backend reads
static fs::path make_interface(const fs::path& root, const std::string& ifname, int arp_type,
                               const std::string& flags, const std::string& operstate) {
    fs::path dir = root / ifname;
    fs::create_directories(dir);
    write_attribute(dir, "type", std::to_string(arp_type));
    write_attribute(dir, "flags", flags);
    write_attribute(dir, "operstate", operstate);
    return dir;
}

void test_sysfs_listing() {
    std::cout << "Testing sysfs adapter enumeration..." << std::endl;

    fs::path root = fs::temp_directory_path() / ("netswitch_sysfs_" + std::to_string(getpid()));
    fs::remove_all(root);

    make_interface(root, "lo", 772, "0x9", "unknown");
    fs::create_directories(make_interface(root, "wlan0", 1, "0x1003", "up") / "wireless");
    fs::create_directories(make_interface(root, "eth0", 1, "0x1002", "down") / "device");
    fs::create_directories(make_interface(root, "br0", 1, "0x1003", "up") / "bridge");
    fs::create_directories(make_interface(root, "lan1", 1, "0x1003", "up") / "device");
    make_interface(root, "dummy1", 1, "0x1003", "");
    make_interface(root, "broken", 1, "zz", "up");

    SysfsAdapterBackend backend(root.string());
    std::vector<NetworkAdapter> adapters;
    std::string error;
    assert(backend.list_adapters(adapters, error));

    std::map<std::string, NetworkAdapter> by_id;
    for (const auto& adapter : adapters) {
        by_id[adapter.device_id] = adapter;
    }

    // Loopback and unreadable flags are skipped
    assert(by_id.size() == 5);
    assert(by_id.count("lo") == 0 && by_id.count("broken") == 0);

    assert(by_id["wlan0"].type == AdapterType::Wireless);
    assert(by_id["wlan0"].enabled);
    assert(by_id["wlan0"].status == "up");

    assert(by_id["eth0"].type == AdapterType::Ethernet);
    assert(!by_id["eth0"].enabled);

    assert(by_id["br0"].type == AdapterType::Virtual);
    assert(by_id["lan1"].type == AdapterType::Ethernet);
    assert(by_id["dummy1"].type == AdapterType::Virtual);
    assert(by_id["dummy1"].status == "unknown");

    SysfsAdapterBackend missing((root / "absent").string());
    adapters.clear();
    assert(!missing.list_adapters(adapters, error));
    assert(!error.empty());

    // Interface names are bounded by IFNAMSIZ
    assert(!backend.set_enabled("", true, error));
    assert(!backend.set_enabled("an-interface-name-that-is-too-long", true, error));

    fs::remove_all(root);
    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== NetworkAdapterService Tests ===\n" << std::endl;

    Log::set_quiet(true);

    test_list_sorted_by_type_then_name();
    test_enable_disable_single();
    test_switch_a_to_b();
    test_switch_b_to_a();
    test_switch_both_off_enables_a();
    test_switch_both_on_takes_a_branch();
    test_switch_failures();
    test_enable_all_partial_failure();
    test_batch_outcomes();
    test_adapter_type_guess();
    test_sysfs_listing();

    std::cout << "\n=== All tests passed! ===\n" << std::endl;
    return 0;
}
