#include "runtime/workflow_plan.hpp"

#include <algorithm>

namespace maestro::runtime {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;
using protocol::WorkflowType;

namespace {

OrchestrationError config_error(const std::string& message, const std::string& code) {
    return OrchestrationError{ErrorCategory::Configuration, message, code};
}

bool is_known_type(const WorkflowType type) {
    switch (type) {
        case WorkflowType::Sequential:
        case WorkflowType::Parallel:
        case WorkflowType::Conditional:
        case WorkflowType::Hierarchical:
            return true;
    }
    return false;
}

enum class Mark { Unvisited, InProgress, Done };

// Depth-first walk along dependency edges; returns the cycle as a path of step
// names when one is reachable from `start`.
std::optional<std::vector<std::size_t>> find_cycle(
    const WorkflowPlan& plan, const std::size_t start, std::vector<Mark>& marks,
    std::vector<std::size_t>& path) {
    marks[start] = Mark::InProgress;
    path.push_back(start);
    for (const auto dependency : plan.dependencies[start]) {
        if (marks[dependency] == Mark::InProgress) {
            auto first = std::find(path.begin(), path.end(), dependency);
            std::vector<std::size_t> cycle(first, path.end());
            cycle.push_back(dependency);
            return cycle;
        }
        if (marks[dependency] == Mark::Unvisited) {
            auto cycle = find_cycle(plan, dependency, marks, path);
            if (cycle.has_value()) {
                return cycle;
            }
        }
    }
    path.pop_back();
    marks[start] = Mark::Done;
    return std::nullopt;
}

}  // namespace

core::errors::Result<WorkflowPlan> build_plan(const protocol::WorkflowDefinition& definition) {
    if (!is_known_type(definition.type)) {
        return config_error("Unknown workflow type for workflow '" + definition.name + "'",
                            "unknown_workflow_type");
    }

    WorkflowPlan plan;
    plan.definition = definition;
    const auto& steps = plan.definition.steps;

    for (std::size_t i = 0; i < steps.size(); ++i) {
        if (steps[i].name.empty()) {
            return config_error("Step #" + std::to_string(i) + " has an empty name",
                                "empty_step_name");
        }
        if (!plan.index_by_name.emplace(steps[i].name, i).second) {
            return config_error("Duplicate step name: " + steps[i].name,
                                "duplicate_step_name");
        }
    }

    plan.dependencies.resize(steps.size());
    plan.children.resize(steps.size());
    plan.conditions.resize(steps.size());
    for (std::size_t i = 0; i < steps.size(); ++i) {
        for (const auto& dependency : steps[i].dependencies) {
            const auto it = plan.index_by_name.find(dependency);
            if (it == plan.index_by_name.end()) {
                return config_error("Step " + steps[i].name +
                                        " depends on unknown step: " + dependency,
                                    "unknown_dependency");
            }
            if (it->second == i) {
                return config_error("Step " + steps[i].name + " depends on itself",
                                    "dependency_cycle");
            }
            auto& resolved = plan.dependencies[i];
            if (std::find(resolved.begin(), resolved.end(), it->second) == resolved.end()) {
                resolved.push_back(it->second);
                plan.children[it->second].push_back(i);
            }
        }
        if (plan.dependencies[i].empty()) {
            plan.roots.push_back(i);
        }

        const auto text = condition_text(steps[i]);
        if (text.has_value()) {
            auto parsed = parse_condition(text.value());
            if (core::errors::is_error(parsed)) {
                auto error = core::errors::get_error(parsed);
                error.message = "Step " + steps[i].name + ": " + error.message;
                return error;
            }
            const auto& condition = core::errors::get_value(parsed);
            if (plan.index_by_name.count(condition.dependency) == 0) {
                return config_error("Step " + steps[i].name +
                                        " has a condition on unknown step: " +
                                        condition.dependency,
                                    "unknown_dependency");
            }
            plan.conditions[i] = condition;
        }
    }

    std::vector<Mark> marks(steps.size(), Mark::Unvisited);
    std::vector<std::size_t> path;
    for (std::size_t i = 0; i < steps.size(); ++i) {
        if (marks[i] != Mark::Unvisited) {
            continue;
        }
        const auto cycle = find_cycle(plan, i, marks, path);
        if (cycle.has_value()) {
            std::string description;
            for (const auto index : cycle.value()) {
                if (!description.empty()) {
                    description += " -> ";
                }
                description += steps[index].name;
            }
            return config_error("Dependency cycle: " + description, "dependency_cycle");
        }
    }

    return plan;
}

}  // namespace maestro::runtime
