#pragma once

#include "key_event_source.hpp"
#include <memory>
#include <string>
#include <vector>

struct libevdev;

namespace netswitch {

// Reads one input device through libevdev. The device is opened read-only
// and never grabbed, so other applications still receive every key.
class EvdevKeyboardSource : public KeyEventSource {
public:
    // require_keyboard: refuse devices without letter keys (auto-detect)
    explicit EvdevKeyboardSource(std::string device_path, bool require_keyboard = false);
    ~EvdevKeyboardSource() override;

    bool open() override;
    void close() override;
    bool is_open() const override { return fd_ >= 0; }
    std::string description() const override { return device_path_; }
    PollStatus poll(std::vector<KeyEvent>& out, int timeout_ms) override;
    int wait_fd() const override { return fd_; }

private:
    std::string device_path_;
    bool require_keyboard_;
    int fd_ = -1;
    struct libevdev* dev_ = nullptr;
};

// Event nodes worth trying, stable names first, each device listed once
std::vector<std::string> find_keyboard_candidates();

// Explicit path: that device only. Empty: every keyboard found on each open().
std::unique_ptr<KeyEventSource> make_keyboard_source(const std::string& device_path);

} // namespace netswitch
