#include "log.hpp"
#include <iostream>
#include <fstream>
#include <mutex>
#include <chrono>
#include <ctime>
#include <cstdlib>
#include <filesystem>

namespace netswitch {

namespace {

std::mutex g_log_mutex;
std::ofstream g_log_file;
bool g_quiet = false;

std::string timestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return buf;
}

void write_line(std::ostream& console, const char* level, const char* tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_log_mutex);

    if (!g_quiet) {
        console << "[" << tag << "] " << message << std::endl;
    }
    if (g_log_file.is_open()) {
        g_log_file << timestamp() << " " << level << " [" << tag << "] " << message << std::endl;
    }
}

} // namespace

void Log::info(const char* tag, const std::string& message) {
    write_line(std::cout, "INFO ", tag, message);
}

void Log::warn(const char* tag, const std::string& message) {
    write_line(std::cerr, "WARN ", tag, message);
}

void Log::error(const char* tag, const std::string& message) {
    write_line(std::cerr, "ERROR", tag, message);
}

bool Log::enable_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file.is_open()) {
        g_log_file.close();
    }

    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    g_log_file.open(path, std::ios::app);
    if (!g_log_file.is_open()) {
        std::cerr << "[log] Failed to open log file: " << path << std::endl;
        return false;
    }
    g_log_file << timestamp() << " INFO  [log] File logging enabled" << std::endl;
    return true;
}

void Log::disable_file() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file.is_open()) {
        g_log_file << timestamp() << " INFO  [log] File logging disabled" << std::endl;
        g_log_file.close();
    }
}

bool Log::file_enabled() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_log_file.is_open();
}

void Log::set_quiet(bool quiet) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_quiet = quiet;
}

std::string Log::default_log_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "netswitch.log";
    return std::string(home) + "/.netswitch/netswitch.log";
}

} // namespace netswitch
