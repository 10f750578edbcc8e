#include "network_service.hpp"
#include "log.hpp"
#include <algorithm>
#include <thread>

namespace netswitch {

static constexpr const char* TAG = "network";

NetworkAdapterService::NetworkAdapterService(std::shared_ptr<AdapterBackend> backend,
                                             std::chrono::milliseconds settle_delay,
                                             SleepFunction sleep)
    : backend_(std::move(backend))
    , settle_delay_(settle_delay)
    , sleep_(std::move(sleep)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

void NetworkAdapterService::set_state_changed_callback(StateChangedCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    state_changed_ = std::move(callback);
}

void NetworkAdapterService::notify_state_changed(const NetworkAdapter& adapter) {
    StateChangedCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = state_changed_;
    }
    if (callback) callback(adapter);
}

AdapterListResult NetworkAdapterService::get_all_adapters() {
    AdapterListResult result;

    std::string error;
    if (!backend_->list_adapters(result.adapters, error)) {
        result.success = false;
        result.error = "Failed to list network adapters: " + error;
        result.adapters.clear();
        return result;
    }

    std::stable_sort(result.adapters.begin(), result.adapters.end(),
                     [](const NetworkAdapter& a, const NetworkAdapter& b) {
                         if (a.type != b.type) return a.type < b.type;
                         return a.name < b.name;
                     });
    result.success = true;
    return result;
}

OperationResult NetworkAdapterService::enable_adapter(const std::string& device_id) {
    return set_adapter_enabled(device_id, true);
}

OperationResult NetworkAdapterService::disable_adapter(const std::string& device_id) {
    return set_adapter_enabled(device_id, false);
}

OperationResult NetworkAdapterService::set_adapter_enabled(const std::string& device_id, bool enabled) {
    const char* verb = enabled ? "enable" : "disable";

    if (device_id.empty()) {
        return OperationResult::error("Device id must not be empty");
    }

    auto listing = get_all_adapters();
    if (!listing.success) {
        return OperationResult::error(listing.error);
    }

    auto it = std::find_if(listing.adapters.begin(), listing.adapters.end(),
                           [&device_id](const NetworkAdapter& a) {
                               return same_device_id(a.device_id, device_id);
                           });
    if (it == listing.adapters.end()) {
        return OperationResult::error("Network adapter not found: " + device_id);
    }

    std::string error;
    if (!backend_->set_enabled(it->device_id, enabled, error)) {
        Log::error(TAG, std::string("Failed to ") + verb + " " + it->name + ": " + error);
        return OperationResult::error(std::string("Failed to ") + verb + " " + it->name + ": " + error);
    }

    NetworkAdapter changed = *it;
    changed.enabled = enabled;
    changed.last_updated = std::chrono::system_clock::now();
    notify_state_changed(changed);

    Log::info(TAG, std::string(enabled ? "Enabled " : "Disabled ") + it->name);
    return OperationResult::ok(std::string(enabled ? "Enabled " : "Disabled ") + it->name);
}

OperationResult NetworkAdapterService::enable_all() {
    return set_all_enabled(true);
}

OperationResult NetworkAdapterService::disable_all() {
    return set_all_enabled(false);
}

OperationResult NetworkAdapterService::set_all_enabled(bool enabled) {
    const char* done = enabled ? "enabled" : "disabled";

    auto listing = get_all_adapters();
    if (!listing.success) {
        return OperationResult::error(listing.error);
    }

    int succeeded = 0;
    int failed = 0;
    std::vector<std::string> errors;

    for (const auto& adapter : listing.adapters) {
        if (adapter.enabled == enabled) continue;

        std::string error;
        if (backend_->set_enabled(adapter.device_id, enabled, error)) {
            ++succeeded;
            NetworkAdapter changed = adapter;
            changed.enabled = enabled;
            changed.last_updated = std::chrono::system_clock::now();
            notify_state_changed(changed);
        } else {
            ++failed;
            errors.push_back(adapter.name + ": " + error);
        }
    }

    OperationResult result;
    if (failed == 0) {
        result = OperationResult::ok(std::string(enabled ? "Enabled " : "Disabled ") +
                                     std::to_string(succeeded) + " adapter(s)");
    } else if (succeeded > 0) {
        result = OperationResult::warning("Partially succeeded: " + std::to_string(succeeded) + " " +
                                          done + ", " + std::to_string(failed) + " failed",
                                          errors);
    } else {
        result = OperationResult::error(std::string("Failed to ") + (enabled ? "enable" : "disable") +
                                        " all adapters", errors);
    }
    result.succeeded = succeeded;
    result.failed = failed;

    if (failed == 0) {
        Log::info(TAG, result.message);
    } else {
        Log::warn(TAG, result.message);
        for (const auto& error : errors) {
            Log::warn(TAG, "  " + error);
        }
    }
    return result;
}

OperationResult NetworkAdapterService::switch_adapters(const std::string& adapter_a,
                                                       const std::string& adapter_b) {
    if (adapter_a.empty() || adapter_b.empty()) {
        return OperationResult::error("Adapter ids must not be empty");
    }
    if (same_device_id(adapter_a, adapter_b)) {
        return OperationResult::error("Cannot switch between the same adapter");
    }

    auto listing = get_all_adapters();
    if (!listing.success) {
        return OperationResult::error(listing.error);
    }

    auto find = [&listing](const std::string& id) -> const NetworkAdapter* {
        for (const auto& adapter : listing.adapters) {
            if (same_device_id(adapter.device_id, id)) return &adapter;
        }
        return nullptr;
    };

    const NetworkAdapter* a = find(adapter_a);
    const NetworkAdapter* b = find(adapter_b);
    if (!a || !b) {
        return OperationResult::error("Network adapter not found: " + (a ? adapter_b : adapter_a));
    }

    // A is checked first, so with both enabled the A-to-B branch runs
    const NetworkAdapter* from = nullptr;
    const NetworkAdapter* to = a;
    if (a->enabled) {
        from = a;
        to = b;
    } else if (b->enabled) {
        from = b;
        to = a;
    }

    std::vector<std::string> details;

    if (from) {
        OperationResult off = disable_adapter(from->device_id);
        sleep_(settle_delay_);
        OperationResult on = enable_adapter(to->device_id);

        if (off.success && on.success) {
            return OperationResult::ok("Switched from " + from->name + " to " + to->name);
        }
        if (!off.success) details.push_back(off.message);
        if (!on.success) details.push_back(on.message);
    } else {
        OperationResult on = enable_adapter(to->device_id);
        if (on.success) {
            return OperationResult::ok("Enabled " + to->name);
        }
        details.push_back(on.message);
    }

    return OperationResult::error("Adapter switch failed", details);
}

} // namespace netswitch
