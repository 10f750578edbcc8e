#include "evdev_source.hpp"
#include "composite_key_source.hpp"
#include "log.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <algorithm>
#include <initializer_list>
#include <set>
#include <fcntl.h>
#include <unistd.h>
#include <linux/input.h>
#include <sys/select.h>
#include <libevdev/libevdev.h>

namespace netswitch {

static constexpr const char* TAG = "hook";

EvdevKeyboardSource::EvdevKeyboardSource(std::string device_path, bool require_keyboard)
    : device_path_(std::move(device_path))
    , require_keyboard_(require_keyboard) {
}

EvdevKeyboardSource::~EvdevKeyboardSource() {
    close();
}

bool EvdevKeyboardSource::open() {
    if (is_open()) return true;

    int fd = ::open(device_path_.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        if (!require_keyboard_) {
            Log::error(TAG, "Cannot open " + device_path_ + ": " + std::strerror(errno));
        }
        return false;
    }

    struct libevdev* dev = nullptr;
    int rc = libevdev_new_from_fd(fd, &dev);
    if (rc < 0) {
        if (!require_keyboard_) {
            Log::error(TAG, "Not an input device: " + device_path_ + ": " + std::strerror(-rc));
        }
        ::close(fd);
        return false;
    }

    // Anything with letter keys counts as a keyboard
    if (require_keyboard_ &&
        !(libevdev_has_event_type(dev, EV_KEY) && libevdev_has_event_code(dev, EV_KEY, KEY_A))) {
        libevdev_free(dev);
        ::close(fd);
        return false;
    }

    fd_ = fd;
    dev_ = dev;
    return true;
}

void EvdevKeyboardSource::close() {
    if (dev_) {
        libevdev_free(dev_);
        dev_ = nullptr;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

PollStatus EvdevKeyboardSource::poll(std::vector<KeyEvent>& out, int timeout_ms) {
    if (!is_open()) return PollStatus::DeviceLost;

    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(fd_, &fds);

    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;

    int ret = select(fd_ + 1, &fds, nullptr, nullptr, &tv);
    if (ret == 0) return PollStatus::Timeout;
    if (ret < 0) {
        if (errno == EINTR) return PollStatus::Timeout;
        return PollStatus::DeviceLost;
    }

    struct input_event ev;
    int flags = LIBEVDEV_READ_FLAG_NORMAL;
    int rc;
    do {
        rc = libevdev_next_event(dev_, flags, &ev);
        if (rc == LIBEVDEV_READ_STATUS_SYNC) {
            // Dropped events: replay the resync stream until it is drained
            flags = LIBEVDEV_READ_FLAG_SYNC;
        } else if (rc == -EAGAIN && flags == LIBEVDEV_READ_FLAG_SYNC) {
            flags = LIBEVDEV_READ_FLAG_NORMAL;
            rc = LIBEVDEV_READ_STATUS_SUCCESS;
            continue;
        }

        if (rc >= 0 && ev.type == EV_KEY) {
            KeyEvent key_event;
            key_event.code = ev.code;
            key_event.value = ev.value;
            out.push_back(key_event);
        }
    } while (rc == LIBEVDEV_READ_STATUS_SUCCESS || rc == LIBEVDEV_READ_STATUS_SYNC);

    if (rc == -ENODEV) {
        return PollStatus::DeviceLost;
    }
    return PollStatus::Events;
}

std::vector<std::string> find_keyboard_candidates() {
    namespace fs = std::filesystem;

    std::vector<std::string> candidates;
    std::set<std::string> seen;
    std::error_code ec;

    auto add = [&](const fs::path& path) {
        std::error_code canon_ec;
        fs::path target = fs::canonical(path, canon_ec);
        std::string key = canon_ec ? path.string() : target.string();
        if (seen.insert(key).second) {
            candidates.push_back(path.string());
        }
    };

    // by-path and by-id symlinks name keyboards explicitly
    for (const char* dir : {"/dev/input/by-path", "/dev/input/by-id"}) {
        std::vector<fs::path> found;
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            std::string name = entry.path().filename().string();
            if (name.size() > 10 && name.compare(name.size() - 10, 10, "-event-kbd") == 0) {
                found.push_back(entry.path());
            }
        }
        std::sort(found.begin(), found.end());
        for (const auto& path : found) add(path);
    }

    // Raw nodes catch keyboards without a udev symlink
    std::vector<fs::path> nodes;
    for (const auto& entry : fs::directory_iterator("/dev/input", ec)) {
        if (entry.path().filename().string().rfind("event", 0) == 0) {
            nodes.push_back(entry.path());
        }
    }
    std::sort(nodes.begin(), nodes.end());
    for (const auto& path : nodes) add(path);

    return candidates;
}

std::unique_ptr<KeyEventSource> make_keyboard_source(const std::string& device_path) {
    if (!device_path.empty()) {
        return std::make_unique<EvdevKeyboardSource>(device_path, false);
    }

    return std::make_unique<CompositeKeySource>([]() {
        std::vector<std::unique_ptr<KeyEventSource>> sources;
        for (const auto& path : find_keyboard_candidates()) {
            sources.push_back(std::make_unique<EvdevKeyboardSource>(path, true));
        }
        if (sources.empty()) {
            Log::error(TAG, "No input devices found. Run as root or add the user to the input group.");
        }
        return sources;
    }, "auto-detected keyboards");
}

} // namespace netswitch
