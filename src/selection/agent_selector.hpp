#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/orchestration_errors.hpp"
#include "protocol/agent_contract.hpp"
#include "protocol/workflow_contract.hpp"
#include "registry/agent_registry.hpp"
#include "selection/task_classifier.hpp"

namespace maestro::selection {

// Optional pre-filter applied before scoring.
struct AgentRequirements {
    std::optional<protocol::AgentType> agent_type;
    std::vector<std::string> required_action_types;  // all must be supported
    double minimum_skill_level = 0.0;                // average over all skills
    double max_load_factor = 1.0;
};

class AgentSelector {
public:
    explicit AgentSelector(std::shared_ptr<const TaskClassifier> classifier =
                               std::make_shared<KeywordTaskClassifier>());

    // score = 10 * matched action types + 5 * relevant skill level
    //         - 2 * load factor + 3 * historical performance
    static double score(const protocol::AgentCapabilities& capabilities,
                        const TaskProfile& profile);

    // Highest score wins. Ties keep the earliest candidate, so the result is
    // stable for a given candidate order. Fails with `no_candidate` when empty.
    core::errors::Result<registry::AgentPtr> select_best_agent(
        const std::string& task,
        const std::vector<registry::AgentPtr>& candidates) const;

    static std::vector<registry::AgentPtr> filter(
        const std::vector<registry::AgentPtr>& candidates,
        const AgentRequirements& requirements);

    // Task text used to pick an agent for a workflow step: the step name followed
    // by its string parameters.
    static std::string describe_step(const protocol::WorkflowStep& step);

private:
    std::shared_ptr<const TaskClassifier> classifier_;
};

}  // namespace maestro::selection
