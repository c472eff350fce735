#pragma once

#include <string>
#include <vector>
#include "core/errors/orchestration_errors.hpp"

namespace maestro::policy {

class SafetyValidator {
public:
    virtual ~SafetyValidator() = default;

    virtual core::errors::Status validate_task(const std::string& task) const = 0;
};

struct TaskPolicy {
    std::vector<std::string> blocked_substrings = {
        "rm -rf",
        "drop table",
        "shutdown",
        "format disk",
        "delete all",
        "exfiltrate"};
};

class KeywordSafetyValidator : public SafetyValidator {
public:
    explicit KeywordSafetyValidator(TaskPolicy task_policy = {});

    core::errors::Status validate_task(const std::string& task) const override;

private:
    static std::string lowercase(std::string value);

    TaskPolicy task_policy_;
};

}  // namespace maestro::policy
