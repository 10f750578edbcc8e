#pragma once

#include "adapter_backend.hpp"
#include "operation_result.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace netswitch {

class NetworkAdapterService {
public:
    using StateChangedCallback = std::function<void(const NetworkAdapter& adapter)>;
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;

    // Time the driver gets between disabling one adapter and enabling the other
    static constexpr std::chrono::milliseconds DEFAULT_SETTLE_DELAY{1000};

    explicit NetworkAdapterService(std::shared_ptr<AdapterBackend> backend,
                                   std::chrono::milliseconds settle_delay = DEFAULT_SETTLE_DELAY,
                                   SleepFunction sleep = nullptr);

    // Sorted by type, then name
    AdapterListResult get_all_adapters();

    OperationResult enable_adapter(const std::string& device_id);
    OperationResult disable_adapter(const std::string& device_id);

    // Batch: only adapters not already in the target state are touched
    OperationResult enable_all();
    OperationResult disable_all();

    // Toggle between two adapters so at most one ends up enabled.
    //   A enabled           -> disable A, settle, enable B   (also when both are on)
    //   B enabled, A not    -> disable B, settle, enable A
    //   neither enabled     -> enable A
    OperationResult switch_adapters(const std::string& adapter_a, const std::string& adapter_b);

    void set_state_changed_callback(StateChangedCallback callback);

private:
    OperationResult set_adapter_enabled(const std::string& device_id, bool enabled);
    OperationResult set_all_enabled(bool enabled);
    void notify_state_changed(const NetworkAdapter& adapter);

    std::shared_ptr<AdapterBackend> backend_;
    std::chrono::milliseconds settle_delay_;
    SleepFunction sleep_;

    std::mutex callback_mutex_;
    StateChangedCallback state_changed_;
};

} // namespace netswitch
