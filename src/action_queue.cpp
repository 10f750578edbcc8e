#include "action_queue.hpp"
#include "log.hpp"
#include <algorithm>
#include <exception>

namespace netswitch {

static constexpr const char* TAG = "app";

ActionQueue::ActionQueue(Handler handler)
    : handler_(std::move(handler)) {
}

ActionQueue::~ActionQueue() {
    stop();
}

void ActionQueue::start() {
    if (running_.load()) return;

    running_.store(true);
    worker_ = std::thread([this]() {
        run_loop();
    });
}

void ActionQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) return;
        running_.store(false);
        queue_.clear();
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
}

bool ActionQueue::post(HotkeyAction action) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) return false;
        // A held or mashed hotkey must not queue the same toggle twice
        if (std::find(queue_.begin(), queue_.end(), action) != queue_.end()) {
            Log::info(TAG, std::string(action_display_name(action)) + " already pending, skipped");
            return true;
        }
        queue_.push_back(action);
    }
    cv_.notify_one();
    return true;
}

size_t ActionQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void ActionQueue::run_loop() {
    while (true) {
        HotkeyAction action;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return !running_.load() || !queue_.empty(); });
            if (!running_.load()) return;
            action = queue_.front();
            queue_.pop_front();
        }

        try {
            handler_(action);
        } catch (const std::exception& e) {
            Log::error(TAG, std::string(action_display_name(action)) + " failed: " + e.what());
        } catch (...) {
            Log::error(TAG, std::string(action_display_name(action)) + " failed with a non-standard exception");
        }
    }
}

} // namespace netswitch
