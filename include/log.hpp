#pragma once

#include <string>

namespace netswitch {

// Console logging with an optional file copy.
// info() goes to stdout, warn()/error() to stderr, each line prefixed with
// "[tag] ". When a log file is set, every line is appended to it with a timestamp.
class Log {
public:
    static void info(const char* tag, const std::string& message);
    static void warn(const char* tag, const std::string& message);
    static void error(const char* tag, const std::string& message);

    // Start appending to path; returns false if the file cannot be opened
    static bool enable_file(const std::string& path);
    static void disable_file();
    static bool file_enabled();

    // Suppress console output (tests); file logging is unaffected
    static void set_quiet(bool quiet);

    // ~/.netswitch/netswitch.log
    static std::string default_log_path();
};

} // namespace netswitch
