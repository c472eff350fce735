#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/agent_contract.hpp"

namespace maestro::protocol {

enum class WorkflowType {
    Sequential,
    Parallel,
    Conditional,
    Hierarchical
};

struct WorkflowStep {
    std::string name;  // unique within a workflow
    AgentType required_agent_type = AgentType::Reactive;
    std::map<std::string, nlohmann::json> parameters;
    std::vector<std::string> dependencies;
    // Conditional workflows only, e.g. "fetch.Success == true".
    std::optional<std::string> condition;
};

struct WorkflowDefinition {
    std::string name;
    WorkflowType type = WorkflowType::Sequential;
    std::vector<WorkflowStep> steps;
};

// Outcome of one completed step. Hierarchical workflows nest the outcomes of a
// step's children beneath it; every other workflow type leaves `children` empty.
struct StepOutcome {
    std::string step_name;
    std::string agent_id;  // empty when no agent was called
    ActionResult result;
    std::vector<StepOutcome> children;

    bool subtree_succeeded() const {
        if (!result.success) {
            return false;
        }
        for (const auto& child : children) {
            if (!child.subtree_succeeded()) {
                return false;
            }
        }
        return true;
    }
};

struct WorkflowResult {
    std::string workflow_name;
    std::string run_id;
    bool success = false;
    std::map<std::string, StepOutcome> results;
    std::vector<std::string> errors;
};

inline std::string to_string(const WorkflowType type) {
    switch (type) {
        case WorkflowType::Sequential:
            return "sequential";
        case WorkflowType::Parallel:
            return "parallel";
        case WorkflowType::Conditional:
            return "conditional";
        case WorkflowType::Hierarchical:
            return "hierarchical";
        default:
            return "unknown";
    }
}

inline std::optional<WorkflowType> parse_workflow_type(const std::string& text) {
    for (const auto type : {WorkflowType::Sequential, WorkflowType::Parallel,
                            WorkflowType::Conditional, WorkflowType::Hierarchical}) {
        if (to_string(type) == text) {
            return type;
        }
    }
    return std::nullopt;
}

inline nlohmann::json to_json(const StepOutcome& outcome) {
    nlohmann::json payload;
    payload["step"] = outcome.step_name;
    payload["agent_id"] = outcome.agent_id;
    payload["result"] = to_json(outcome.result);
    if (!outcome.children.empty()) {
        nlohmann::json children = nlohmann::json::array();
        for (const auto& child : outcome.children) {
            children.push_back(to_json(child));
        }
        payload["children"] = children;
    }
    return payload;
}

inline nlohmann::json to_json(const WorkflowStep& step) {
    nlohmann::json payload;
    payload["name"] = step.name;
    payload["required_agent_type"] = to_string(step.required_agent_type);
    payload["parameters"] = step.parameters;
    payload["dependencies"] = step.dependencies;
    if (step.condition.has_value()) {
        payload["condition"] = step.condition.value();
    }
    return payload;
}

inline nlohmann::json to_json(const WorkflowDefinition& workflow) {
    nlohmann::json steps = nlohmann::json::array();
    for (const auto& step : workflow.steps) {
        steps.push_back(to_json(step));
    }
    nlohmann::json payload;
    payload["name"] = workflow.name;
    payload["type"] = to_string(workflow.type);
    payload["steps"] = steps;
    return payload;
}

}  // namespace maestro::protocol
