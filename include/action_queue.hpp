#pragma once

#include "hotkey_config.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace netswitch {

// Single worker that runs hotkey actions off the input thread.
// post() never blocks on the handler, so the keyboard listener stays responsive.
class ActionQueue {
public:
    using Handler = std::function<void(HotkeyAction action)>;

    explicit ActionQueue(Handler handler);
    ~ActionQueue();

    ActionQueue(const ActionQueue&) = delete;
    ActionQueue& operator=(const ActionQueue&) = delete;

    void start();

    // Finish the action in progress, drop the rest and join
    void stop();

    // Returns false when the queue is not running. An action already waiting
    // in the queue is not added a second time.
    bool post(HotkeyAction action);

    size_t pending() const;

private:
    void run_loop();

    Handler handler_;
    std::atomic<bool> running_{false};
    std::thread worker_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<HotkeyAction> queue_;
};

} // namespace netswitch
