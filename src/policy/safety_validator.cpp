#include "policy/safety_validator.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace maestro::policy {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;

KeywordSafetyValidator::KeywordSafetyValidator(TaskPolicy task_policy)
    : task_policy_(std::move(task_policy)) {}

std::string KeywordSafetyValidator::lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

core::errors::Status KeywordSafetyValidator::validate_task(
    const std::string& task) const {
    if (task.empty()) {
        return OrchestrationError{ErrorCategory::Input, "Task cannot be empty.",
                                  "empty_task"};
    }

    const std::string lowered = lowercase(task);
    for (const auto& blocked : task_policy_.blocked_substrings) {
        const std::string blocked_lowered = lowercase(blocked);
        if (lowered.find(blocked_lowered) == std::string::npos) {
            continue;
        }
        return OrchestrationError{ErrorCategory::Policy,
                                  "Task contains blocked operation: " + blocked,
                                  "task_rejected"};
    }

    return core::errors::ok();
}

}  // namespace maestro::policy
