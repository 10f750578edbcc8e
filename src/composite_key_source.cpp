#include "composite_key_source.hpp"
#include "log.hpp"
#include <algorithm>
#include <cerrno>
#include <sys/select.h>

namespace netswitch {

static constexpr const char* TAG = "hook";

CompositeKeySource::CompositeKeySource(Factory factory, std::string name)
    : factory_(std::move(factory))
    , name_(std::move(name)) {
}

CompositeKeySource::~CompositeKeySource() {
    close();
}

bool CompositeKeySource::open() {
    if (is_open()) return true;
    if (!factory_) return false;

    auto candidates = factory_();

    std::lock_guard<std::mutex> lock(members_mutex_);
    for (auto& member : candidates) {
        if (member && member->open()) {
            members_.push_back(std::move(member));
        }
    }
    if (members_.empty()) {
        Log::error(TAG, "None of " + std::to_string(candidates.size()) + " candidate(s) for " +
                        name_ + " could be opened");
        return false;
    }
    return true;
}

void CompositeKeySource::close() {
    std::lock_guard<std::mutex> lock(members_mutex_);
    for (auto& member : members_) {
        member->close();
    }
    members_.clear();
}

bool CompositeKeySource::is_open() const {
    std::lock_guard<std::mutex> lock(members_mutex_);
    return !members_.empty();
}

size_t CompositeKeySource::member_count() const {
    std::lock_guard<std::mutex> lock(members_mutex_);
    return members_.size();
}

std::string CompositeKeySource::description() const {
    std::lock_guard<std::mutex> lock(members_mutex_);
    if (members_.empty()) return name_;

    std::string text;
    for (const auto& member : members_) {
        if (!member) continue;
        if (!text.empty()) text += ", ";
        text += member->description();
    }
    return text;
}

PollStatus CompositeKeySource::drain(size_t index, std::vector<KeyEvent>& out, int timeout_ms) {
    PollStatus status = members_[index]->poll(out, timeout_ms);
    if (status == PollStatus::DeviceLost) {
        Log::warn(TAG, "Keyboard removed: " + members_[index]->description());
        members_[index]->close();
        std::lock_guard<std::mutex> lock(members_mutex_);
        members_[index].reset();
    }
    return status;
}

PollStatus CompositeKeySource::poll(std::vector<KeyEvent>& out, int timeout_ms) {
    if (!is_open()) return PollStatus::DeviceLost;

    bool all_have_fds = std::all_of(members_.begin(), members_.end(),
                                     [](const std::unique_ptr<KeyEventSource>& m) {
                                         return m->wait_fd() >= 0;
                                     });

    if (all_have_fds) {
        fd_set fds;
        FD_ZERO(&fds);
        int max_fd = -1;
        for (const auto& member : members_) {
            FD_SET(member->wait_fd(), &fds);
            max_fd = std::max(max_fd, member->wait_fd());
        }

        struct timeval tv;
        tv.tv_sec = timeout_ms / 1000;
        tv.tv_usec = (timeout_ms % 1000) * 1000;

        int ret = select(max_fd + 1, &fds, nullptr, nullptr, &tv);
        if (ret == 0) return PollStatus::Timeout;
        if (ret < 0) {
            // EINTR or a member fd went bad: let every member report for itself
            for (size_t i = 0; i < members_.size(); ++i) {
                drain(i, out, 0);
            }
        } else {
            for (size_t i = 0; i < members_.size(); ++i) {
                if (FD_ISSET(members_[i]->wait_fd(), &fds)) {
                    drain(i, out, 0);
                }
            }
        }
    } else {
        // Sources without a descriptor share the timeout
        int slice = std::max(1, timeout_ms / static_cast<int>(members_.size()));
        for (size_t i = 0; i < members_.size(); ++i) {
            drain(i, out, slice);
        }
    }

    std::lock_guard<std::mutex> lock(members_mutex_);
    members_.erase(std::remove(members_.begin(), members_.end(), nullptr), members_.end());

    if (members_.empty()) return PollStatus::DeviceLost;
    return out.empty() ? PollStatus::Timeout : PollStatus::Events;
}

} // namespace netswitch
