// Automated tests for ApplicationConfig validation and ConfigStore

#include "config.hpp"
#include "config_store.hpp"
#include "log.hpp"
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace netswitch;
namespace fs = std::filesystem;

static fs::path make_temp_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() /
                   ("netswitch_test_" + name + "_" + std::to_string(getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static void write_file(const fs::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::trunc);
    file << content;
}

static std::string read_file(const fs::path& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

static bool contains(const std::vector<std::string>& errors, const std::string& needle) {
    for (const auto& error : errors) {
        if (error.find(needle) != std::string::npos) return true;
    }
    return false;
}

void test_defaults() {
    std::cout << "Testing default configuration..." << std::endl;

    ApplicationConfig config;
    assert(config.hotkeys.size() == 3);
    assert(config.adapter_a.empty() && config.adapter_b.empty());
    assert(!config.is_switch_configured());
    assert(config.refresh_interval == 60);
    assert(config.show_notifications);
    assert(!config.enable_logging);
    assert(config.validate().empty());

    const HotkeyConfig* sw = config.find_hotkey(HotkeyAction::SwitchAdapters);
    assert(sw != nullptr && sw->key == Key::S);

    config.adapter_a = "wlan0";
    config.adapter_b = "eth0";
    assert(config.is_switch_configured());

    std::cout << "  PASS" << std::endl;
}

void test_validation() {
    std::cout << "Testing validation rules..." << std::endl;

    ApplicationConfig config;
    config.hotkeys.push_back({4, HotkeyAction::DisableAll,
                              ModifierKeys::Control | ModifierKeys::Alt | ModifierKeys::Shift, Key::E, true});
    auto errors = config.validate();
    assert(errors.size() == 1);
    assert(contains(errors, "Hotkey conflict"));

    // A disabled duplicate is not a conflict
    config.hotkeys.back().enabled = false;
    assert(config.validate().empty());

    config.adapter_a = "eth0";
    config.adapter_b = "eth0";
    assert(contains(config.validate(), "Adapter A and adapter B"));

    // Device ids compare without case
    config.adapter_b = "ETH0";
    assert(contains(config.validate(), "Adapter A and adapter B"));
    assert(!config.is_switch_configured());
    config.adapter_b = "wlan0";
    assert(config.is_switch_configured());

    config.window.width = 200;
    assert(contains(config.validate(), "Window is too small"));
    config.window.width = 800;

    config.refresh_interval = -1;
    assert(contains(config.validate(), "must not be negative"));
    config.refresh_interval = 2;
    assert(contains(config.validate(), "between 5 and 3600"));
    config.refresh_interval = 0;
    assert(config.validate().empty());

    std::cout << "  PASS" << std::endl;
}

void test_update_hotkey() {
    std::cout << "Testing hotkey update by id..." << std::endl;

    ApplicationConfig config;
    config.update_hotkey({2, HotkeyAction::DisableAll, ModifierKeys::Shift, Key::D, false});
    assert(config.hotkeys.size() == 3);
    assert(config.hotkeys[1].key == Key::D);
    assert(config.hotkeys[1].modifiers == ModifierKeys::Shift);
    assert(!config.hotkeys[1].enabled);

    config.update_hotkey({8, HotkeyAction::EnableAll, ModifierKeys::Alt, Key::E, true});
    assert(config.hotkeys.size() == 4);

    std::cout << "  PASS" << std::endl;
}

void test_parse() {
    std::cout << "Testing configuration parsing..." << std::endl;

    std::istringstream in(
        "# comment\n"
        "\n"
        "adapter_a = wlan0\n"
        "adapter_b = eth0\n"
        "hotkey = 10, SwitchAdapters, Ctrl+Shift, S, true\n"
        "hotkey = 11, EnableAll, Alt, 1, false\n"
        "refresh_interval = 0\n"
        "show_notifications = no\n"
        "keyboard_device = /dev/input/event3\n"
        "colour = blue\n"
        "this line has no separator\n"
        "hotkey = 12, Explode, Ctrl, F1, true\n"
        "window_width = wide\n");

    ApplicationConfig config;
    std::vector<std::string> warnings;
    ConfigStore::parse(in, config, warnings);

    assert(config.adapter_a == "wlan0");
    assert(config.adapter_b == "eth0");
    assert(config.refresh_interval == 0);
    assert(!config.show_notifications);
    assert(config.keyboard_device == "/dev/input/event3");

    // Hotkey lines replace the defaults; the malformed one is skipped
    assert(config.hotkeys.size() == 2);
    assert(config.hotkeys[0].id == 10);
    assert(config.hotkeys[0].modifiers == (ModifierKeys::Control | ModifierKeys::Shift));
    assert(config.hotkeys[0].key == Key::S);
    assert(config.hotkeys[1].key == Key::D1);
    assert(!config.hotkeys[1].enabled);

    assert(warnings.size() == 4);
    assert(contains(warnings, "unknown setting 'colour'"));
    assert(contains(warnings, "expected key = value"));
    assert(contains(warnings, "invalid value for hotkey"));
    assert(contains(warnings, "invalid value for window_width"));
    assert(config.window.width == 800);

    std::cout << "  PASS" << std::endl;
}

void test_parse_without_hotkeys_keeps_defaults() {
    std::cout << "Testing file without hotkey lines..." << std::endl;

    std::istringstream in("adapter_a = wlan0\n");
    ApplicationConfig config;
    std::vector<std::string> warnings;
    ConfigStore::parse(in, config, warnings);

    assert(warnings.empty());
    assert(config.hotkeys.size() == 3);

    std::cout << "  PASS" << std::endl;
}

void test_serialize_parse() {
    std::cout << "Testing serialized text reads back..." << std::endl;

    ApplicationConfig config;
    config.adapter_a = "wlp2s0";
    config.adapter_b = "enp3s0";
    config.refresh_interval = 120;
    config.enable_logging = true;
    config.hotkeys[2].enabled = false;

    std::string text = ConfigStore::serialize(config);
    assert(text.find("hotkey = 3, SwitchAdapters, Ctrl+Alt+Shift, S, false") != std::string::npos);

    std::istringstream in(text);
    ApplicationConfig loaded;
    std::vector<std::string> warnings;
    ConfigStore::parse(in, loaded, warnings);

    assert(warnings.empty());
    assert(loaded.adapter_a == "wlp2s0");
    assert(loaded.adapter_b == "enp3s0");
    assert(loaded.refresh_interval == 120);
    assert(loaded.enable_logging);
    assert(loaded.hotkeys.size() == 3);
    assert(!loaded.hotkeys[2].enabled);

    std::cout << "  PASS" << std::endl;
}

void test_load_creates_defaults() {
    std::cout << "Testing load with missing file..." << std::endl;

    fs::path dir = make_temp_dir("missing");
    fs::path path = dir / "nested" / "config.conf";
    ConfigStore store(path.string());
    assert(!store.exists());

    ApplicationConfig config;
    config.adapter_a = "stale";
    auto result = store.load(config);
    assert(result.success);
    assert(result.type == ResultType::Success);
    assert(store.exists());
    assert(config.adapter_a.empty());
    assert(config.hotkeys.size() == 3);

    // Empty file also yields defaults
    write_file(path, "   \n");
    config.adapter_a = "stale";
    result = store.load(config);
    assert(result.success);
    assert(config.adapter_a.empty());

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_load_reports_problems() {
    std::cout << "Testing load with problems..." << std::endl;

    fs::path dir = make_temp_dir("problems");
    fs::path path = dir / "config.conf";
    write_file(path,
               "adapter_a = eth0\n"
               "adapter_b = eth0\n"
               "bogus = 1\n");

    ConfigStore store(path.string());
    ApplicationConfig config;
    auto result = store.load(config);
    assert(result.success);
    assert(result.type == ResultType::Warning);
    assert(result.error_details.size() == 2);
    assert(config.adapter_a == "eth0");

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_save_and_backup() {
    std::cout << "Testing save with backup..." << std::endl;

    fs::path dir = make_temp_dir("save");
    fs::path path = dir / "config.conf";
    ConfigStore store(path.string());

    ApplicationConfig first;
    first.adapter_a = "wlan0";
    first.adapter_b = "eth0";
    assert(store.save(first).success);
    assert(!fs::exists(store.backup_path()));

    ApplicationConfig second = first;
    second.adapter_b = "usb0";
    assert(store.save(second).success);
    assert(fs::exists(store.backup_path()));
    assert(read_file(store.backup_path()).find("adapter_b = eth0") != std::string::npos);
    assert(read_file(path).find("adapter_b = usb0") != std::string::npos);

    // Invalid config is refused and the file is untouched
    ApplicationConfig broken = second;
    broken.hotkeys.push_back({5, HotkeyAction::EnableAll,
                              ModifierKeys::Control | ModifierKeys::Alt | ModifierKeys::Shift, Key::S, true});
    auto result = store.save(broken);
    assert(!result.success);
    assert(result.message.find("Hotkey conflict") != std::string::npos);
    assert(read_file(path).find("hotkey = 5") == std::string::npos);

    assert(store.restore_backup().success);
    ApplicationConfig restored;
    assert(store.load(restored).success);
    assert(restored.adapter_b == "eth0");

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_reset_import_export() {
    std::cout << "Testing reset, import and export..." << std::endl;

    fs::path dir = make_temp_dir("import");
    ConfigStore store((dir / "config.conf").string());

    ApplicationConfig config;
    config.adapter_a = "wlan0";
    config.adapter_b = "eth0";
    assert(store.save(config).success);

    fs::path exported = dir / "exported.conf";
    assert(store.export_to(exported.string()).success);
    assert(read_file(exported).find("adapter_a = wlan0") != std::string::npos);

    ApplicationConfig reset;
    assert(store.reset_to_default(reset).success);
    assert(reset.adapter_a.empty());

    ApplicationConfig imported;
    auto result = store.import_from(exported.string(), imported);
    assert(result.success);
    assert(imported.adapter_a == "wlan0");

    ApplicationConfig reloaded;
    assert(store.load(reloaded).success);
    assert(reloaded.adapter_b == "eth0");

    // Missing and malformed imports are rejected
    assert(!store.import_from((dir / "absent.conf").string(), imported).success);
    write_file(dir / "bad.conf", "hotkey = nonsense\n");
    assert(!store.import_from((dir / "bad.conf").string(), imported).success);
    assert(!store.export_to("").success);

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Configuration Tests ===\n" << std::endl;

    Log::set_quiet(true);

    test_defaults();
    test_validation();
    test_update_hotkey();
    test_parse();
    test_parse_without_hotkeys_keeps_defaults();
    test_serialize_parse();
    test_load_creates_defaults();
    test_load_reports_problems();
    test_save_and_backup();
    test_reset_import_export();

    std::cout << "\n=== All tests passed! ===\n" << std::endl;
    return 0;
}
