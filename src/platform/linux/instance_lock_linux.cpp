#include "instance_lock.hpp"
#include "log.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>

namespace netswitch {

InstanceLock::InstanceLock(std::string path)
    : path_(path.empty() ? default_lock_path() : std::move(path)) {
}

InstanceLock::~InstanceLock() {
    release();
}

std::string InstanceLock::default_lock_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "/tmp/netswitch.lock";
    return std::string(home) + "/.netswitch/netswitch.lock";
}

bool InstanceLock::acquire() {
    if (held()) return true;

    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        Log::error("app", "Cannot open lock file " + path_ + ": " + std::strerror(errno));
        return false;
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        ::close(fd);
        return false;
    }

    std::string pid = std::to_string(getpid()) + "\n";
    if (ftruncate(fd, 0) == 0) {
        ssize_t written = ::write(fd, pid.data(), pid.size());
        (void)written;
    }

    fd_ = fd;
    return true;
}

void InstanceLock::release() {
    if (fd_ < 0) return;
    flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

} // namespace netswitch
