#pragma once

#include "key_event_source.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace netswitch {

// Merges several key sources (one per keyboard) into one stream.
// The member list is rebuilt by the factory on every open(), so a reinstall
// picks up keyboards plugged in since the last one. Open while at least one
// member is still delivering; a member that disappears is dropped, and the
// whole source reports DeviceLost only when the last member is gone.
class CompositeKeySource : public KeyEventSource {
public:
    using Factory = std::function<std::vector<std::unique_ptr<KeyEventSource>>()>;

    explicit CompositeKeySource(Factory factory, std::string name = "keyboards");
    ~CompositeKeySource() override;

    bool open() override;
    void close() override;
    bool is_open() const override;
    std::string description() const override;
    PollStatus poll(std::vector<KeyEvent>& out, int timeout_ms) override;

    size_t member_count() const;

private:
    PollStatus drain(size_t index, std::vector<KeyEvent>& out, int timeout_ms);

    Factory factory_;
    std::string name_;

    // Only the listener removes members while open; the lock covers readers
    // on other threads (description, member_count)
    mutable std::mutex members_mutex_;
    std::vector<std::unique_ptr<KeyEventSource>> members_;
};

} // namespace netswitch
