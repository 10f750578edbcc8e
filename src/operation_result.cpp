#include "operation_result.hpp"
#include <utility>

namespace netswitch {

const char* result_type_name(ResultType type) {
    switch (type) {
        case ResultType::Success: return "Success";
        case ResultType::Error: return "Error";
        case ResultType::Warning: return "Warning";
        case ResultType::Information: return "Information";
    }
    return "Unknown";
}

OperationResult OperationResult::ok(const std::string& message) {
    OperationResult result;
    result.success = true;
    result.type = ResultType::Success;
    result.message = message;
    return result;
}

OperationResult OperationResult::error(const std::string& message,
                                       std::vector<std::string> details) {
    OperationResult result;
    result.success = false;
    result.type = ResultType::Error;
    result.message = message;
    result.error_details = std::move(details);
    return result;
}

OperationResult OperationResult::warning(const std::string& message,
                                         std::vector<std::string> details) {
    OperationResult result;
    result.success = true;
    result.type = ResultType::Warning;
    result.message = message;
    result.error_details = std::move(details);
    return result;
}

OperationResult OperationResult::info(const std::string& message) {
    OperationResult result;
    result.success = true;
    result.type = ResultType::Information;
    result.message = message;
    return result;
}

std::string OperationResult::to_string() const {
    return std::string("[") + result_type_name(type) + "] " +
           (success ? "ok" : "failed") + ": " + message;
}

} // namespace netswitch
