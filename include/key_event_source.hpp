#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace netswitch {

// Raw key transition as delivered by the input layer (Linux input codes)
struct KeyEvent {
    uint16_t code = 0;
    int value = 0;  // 0 released, 1 pressed, 2 autorepeat
};

constexpr int KEY_VALUE_RELEASED = 0;
constexpr int KEY_VALUE_PRESSED = 1;
constexpr int KEY_VALUE_REPEAT = 2;

enum class PollStatus {
    Events,      // zero or more events appended
    Timeout,
    DeviceLost   // handle is dead, caller must close and reopen
};

// Where keyboard events come from. An open source is the hook "handle".
// Implementations only observe input; they must never grab the device, so
// every key keeps reaching the rest of the system.
class KeyEventSource {
public:
    virtual ~KeyEventSource() = default;

    virtual bool open() = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    // Device path or other human-readable identity
    virtual std::string description() const = 0;

    // Wait up to timeout_ms and append any key events to out
    virtual PollStatus poll(std::vector<KeyEvent>& out, int timeout_ms) = 0;

    // File descriptor that becomes readable when events are pending, or -1.
    // Lets a CompositeKeySource wait on several devices in one select().
    virtual int wait_fd() const { return -1; }
};

} // namespace netswitch
