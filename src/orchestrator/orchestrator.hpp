#pragma once

#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/orchestrator_config.hpp"
#include "core/errors/orchestration_errors.hpp"
#include "events/event_bus.hpp"
#include "observability/metrics.hpp"
#include "policy/safety_validator.hpp"
#include "protocol/workflow_contract.hpp"
#include "registry/agent_registry.hpp"
#include "runtime/step_executor.hpp"
#include "runtime/workflow_engine.hpp"
#include "selection/agent_selector.hpp"
#include "session/run_manager.hpp"

namespace maestro::orchestrator {

// Optional collaborators. Any of them may be null; a missing collaborator turns
// the matching hook into a no-op without changing workflow behaviour.
// The orchestrator does not own them and they must outlive it.
struct Collaborators {
    events::EventBus* event_bus = nullptr;
    observability::MetricsSink* metrics = nullptr;
    const policy::SafetyValidator* safety_validator = nullptr;
    std::shared_ptr<const selection::TaskClassifier> classifier;
};

class Orchestrator {
public:
    Orchestrator(registry::AgentRegistry& registry, Collaborators collaborators = {},
                 core::config::OrchestratorConfig config = {});

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    void register_agent(registry::AgentPtr agent);
    void unregister_agent(const std::string& agent_id);

    // Scores every registered agent (optionally pre-filtered) against the task.
    core::errors::Result<registry::AgentPtr> assign_task(
        const std::string& task,
        const std::optional<selection::AgentRequirements>& requirements = std::nullopt);

    // Validates and runs the workflow to completion. Returns an error only for
    // a structurally invalid definition.
    core::errors::Result<protocol::WorkflowResult> execute_workflow(
        const protocol::WorkflowDefinition& workflow);

    // Two-phase form of execute_workflow so another thread can cancel by run id.
    core::errors::Result<std::string> begin_workflow(const protocol::WorkflowDefinition& workflow);
    core::errors::Result<protocol::WorkflowResult> run_workflow(const std::string& run_id);

    core::errors::Result<session::RunState> cancel_workflow(const std::string& run_id);
    core::errors::Result<session::RunState> workflow_state(const std::string& run_id) const;

    // Forgets a finished run. Only the most recent `retained_runs` finished runs
    // are kept in any case.
    core::errors::Status release_workflow(const std::string& run_id);

    const registry::AgentRegistry& registry() const { return registry_; }

private:
    void publish(const std::string& topic, const nlohmann::json& payload) const;

    registry::AgentRegistry& registry_;
    Collaborators collaborators_;
    core::config::OrchestratorConfig config_;
    selection::AgentSelector selector_;
    runtime::StepExecutor executor_;
    runtime::WorkflowEngine engine_;
    session::RunManager run_manager_;
};

}  // namespace maestro::orchestrator
