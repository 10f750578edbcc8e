#pragma once

#include "network_adapter.hpp"
#include <string>
#include <vector>

namespace netswitch {

enum class ResultType {
    Success,
    Error,
    Warning,
    Information
};

const char* result_type_name(ResultType type);

struct OperationResult {
    bool success = false;
    ResultType type = ResultType::Error;
    std::string message;
    std::vector<std::string> error_details;

    // Batch operations only
    int succeeded = 0;
    int failed = 0;

    static OperationResult ok(const std::string& message);
    static OperationResult error(const std::string& message,
                                 std::vector<std::string> details = {});
    // Counts as success: the operation went through, with caveats
    static OperationResult warning(const std::string& message,
                                   std::vector<std::string> details = {});
    static OperationResult info(const std::string& message);

    // "[Warning] ok: partially succeeded: 2 enabled, 3 failed"
    std::string to_string() const;
};

struct AdapterListResult {
    bool success = false;
    std::string error;
    std::vector<NetworkAdapter> adapters;
};

} // namespace netswitch
