#pragma once
#include <exception>
#include <string>
#include <variant>

namespace maestro::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Configuration,  // E.g., cyclic dependencies, unknown workflow type
        Selection,      // E.g., no registered agent of the required type
        Decision,       // E.g., an agent failed to decide on an action
        Execution,      // E.g., an action failed while running
        Dependency,     // E.g., a required step did not succeed
        Cancelled,      // E.g., the caller cancelled the workflow run
        Timeout,        // E.g., a step exceeded its deadline
        Policy,         // E.g., a task was rejected by the safety validator
        Input,          // E.g., bad CLI flag or malformed workflow file
        Internal        // E.g., C++ logic bug
    };

    // The standardized error payload
    struct OrchestrationError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy: a Result holds either a value of type T or an error.
    template <typename T>
    using Result = std::variant<T, OrchestrationError>;

    // Result for operations with nothing to return.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<OrchestrationError>(result);
    }

    template <typename T>
    const OrchestrationError& get_error(const Result<T>& result) {
        return std::get<OrchestrationError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // Runs `call` and turns anything it throws into an error of `category`.
    // Used around every call into an agent, since agents are caller code.
    template <typename T, typename Call>
    Result<T> capture(const Call& call, const ErrorCategory category, const std::string& what,
                      const std::string& code = "agent_exception") {
        try {
            return call();
        } catch (const std::exception& ex) {
            return OrchestrationError{category, what + " threw: " + ex.what(), code};
        } catch (...) {
            return OrchestrationError{category, what + " threw a non-standard exception", code};
        }
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Configuration: return "configuration";
            case ErrorCategory::Selection:     return "selection";
            case ErrorCategory::Decision:      return "decision";
            case ErrorCategory::Execution:     return "execution";
            case ErrorCategory::Dependency:    return "dependency";
            case ErrorCategory::Cancelled:     return "cancelled";
            case ErrorCategory::Timeout:       return "timeout";
            case ErrorCategory::Policy:        return "policy";
            case ErrorCategory::Input:         return "input";
            case ErrorCategory::Internal:      return "internal";
            default: return "unknown";
        }
    }

} // namespace maestro::core::errors
