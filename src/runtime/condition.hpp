#pragma once

#include <map>
#include <optional>
#include <string>
#include "core/errors/orchestration_errors.hpp"
#include "protocol/agent_contract.hpp"
#include "protocol/workflow_contract.hpp"

namespace maestro::runtime {

enum class ConditionField {
    Success
};

// Comparison of one field of a dependency's result against a literal:
//   <dependency>.Success == <true|false>
struct Condition {
    std::string dependency;
    ConditionField field = ConditionField::Success;
    bool expected = true;
};

enum class ConditionOutcome {
    Met,
    NotMet,
    DependencyMissing
};

core::errors::Result<Condition> parse_condition(const std::string& text);

ConditionOutcome evaluate(const Condition& condition,
                          const std::map<std::string, protocol::ActionResult>& context);

// The step's condition string: the `condition` field, or else a string
// parameter named "condition".
std::optional<std::string> condition_text(const protocol::WorkflowStep& step);

}  // namespace maestro::runtime
