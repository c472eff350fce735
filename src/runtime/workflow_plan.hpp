#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/orchestration_errors.hpp"
#include "protocol/workflow_contract.hpp"
#include "runtime/condition.hpp"

namespace maestro::runtime {

// Validated, indexed view of a WorkflowDefinition. Built once before any step
// runs; step indices refer to positions in `definition.steps`.
struct WorkflowPlan {
    protocol::WorkflowDefinition definition;
    std::unordered_map<std::string, std::size_t> index_by_name;
    std::vector<std::vector<std::size_t>> dependencies;  // resolved, de-duplicated
    std::vector<std::vector<std::size_t>> children;      // reverse of dependencies
    std::vector<std::size_t> roots;                      // steps without dependencies
    std::vector<std::optional<Condition>> conditions;

    const protocol::WorkflowStep& step(std::size_t index) const {
        return definition.steps[index];
    }
};

// Rejects unknown workflow types, empty or duplicate step names, dependencies on
// unknown steps or on the step itself, dependency cycles and malformed
// conditions. All failures are Configuration errors.
core::errors::Result<WorkflowPlan> build_plan(const protocol::WorkflowDefinition& definition);

}  // namespace maestro::runtime
