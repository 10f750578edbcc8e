#pragma once

#include <string>

namespace netswitch {

// Advisory lock file that keeps a second daemon from starting.
// Held until destruction.
class InstanceLock {
public:
    explicit InstanceLock(std::string path = "");
    ~InstanceLock();

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    // False if another process holds the lock or the file cannot be opened
    bool acquire();
    void release();
    bool held() const { return fd_ >= 0; }

    const std::string& path() const { return path_; }

    // ~/.netswitch/netswitch.lock
    static std::string default_lock_path();

private:
    std::string path_;
    int fd_ = -1;
};

} // namespace netswitch
