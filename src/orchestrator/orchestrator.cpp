#include "orchestrator/orchestrator.hpp"

#include <utility>
#include <variant>
#include <vector>
#include "core/logging/logger.hpp"
#include "protocol/event_contract.hpp"

namespace maestro::orchestrator {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;

Orchestrator::Orchestrator(registry::AgentRegistry& registry, Collaborators collaborators,
                           core::config::OrchestratorConfig config)
    : registry_(registry),
      collaborators_(std::move(collaborators)),
      config_(config),
      selector_(collaborators_.classifier),
      executor_(collaborators_.event_bus, collaborators_.metrics,
                config_.publish_step_events),
      engine_(registry_, selector_, executor_, config_),
      run_manager_(config_.retained_runs) {}

void Orchestrator::publish(const std::string& topic, const nlohmann::json& payload) const {
    if (collaborators_.event_bus == nullptr) {
        return;
    }
    const auto published = core::errors::capture<std::monostate>(
        [this, &topic, &payload]() { return collaborators_.event_bus->publish(topic, payload); },
        ErrorCategory::Internal, "Event bus", "publish_failed");
    if (core::errors::is_error(published)) {
        LOG_WARN("Orchestrator: failed to publish " + topic + ": " +
                 core::errors::get_error(published).message);
    }
}

void Orchestrator::register_agent(registry::AgentPtr agent) {
    const auto registered = registry_.register_agent(std::move(agent));
    if (core::errors::is_error(registered)) {
        LOG_WARN("Orchestrator: agent not registered: " +
                 core::errors::get_error(registered).message);
        return;
    }
    const auto& registration = core::errors::get_value(registered);
    if (!registration.replaced) {
        observability::increment(collaborators_.metrics, "orchestrator.agents.count");
    }
    publish(protocol::topics::kAgentRegistered,
            protocol::to_json(protocol::AgentRegisteredEvent{registration.identity.id,
                                                             registration.identity.name}));
}

void Orchestrator::unregister_agent(const std::string& agent_id) {
    if (!registry_.unregister_agent(agent_id)) {
        return;
    }
    observability::increment(collaborators_.metrics, "orchestrator.agents.count", -1.0);
    publish(protocol::topics::kAgentUnregistered,
            protocol::to_json(protocol::AgentUnregisteredEvent{agent_id}));
}

core::errors::Result<registry::AgentPtr> Orchestrator::assign_task(
    const std::string& task,
    const std::optional<selection::AgentRequirements>& requirements) {
    if (task.empty()) {
        return OrchestrationError{ErrorCategory::Input, "Task cannot be empty.",
                                  "empty_task"};
    }

    if (collaborators_.safety_validator != nullptr) {
        const auto verdict = collaborators_.safety_validator->validate_task(task);
        if (core::errors::is_error(verdict)) {
            const auto& error = core::errors::get_error(verdict);
            LOG_WARN("Orchestrator: task rejected [" + error.code + "]: " + error.message);
            return error;
        }
    }

    std::vector<registry::AgentPtr> candidates = registry_.all_agents();
    if (requirements.has_value()) {
        candidates = selection::AgentSelector::filter(candidates, requirements.value());
    }

    auto selected = selector_.select_best_agent(task, candidates);
    if (core::errors::is_error(selected)) {
        LOG_WARN("Orchestrator: no agent available for task '" + task + "'");
        return core::errors::get_error(selected);
    }

    const auto& agent = core::errors::get_value(selected);
    const auto identity = registry::AgentRegistry::read_identity(agent);
    if (core::errors::is_error(identity)) {
        LOG_WARN("Orchestrator: selected agent for task '" + task + "' is unusable: " +
                 core::errors::get_error(identity).message);
        return core::errors::get_error(identity);
    }
    const auto& [agent_id, agent_name, agent_type] = core::errors::get_value(identity);
    LOG_INFO("Orchestrator: assigned task '" + task + "' to agent " + agent_name + " (" +
             agent_id + ", " + protocol::to_string(agent_type) + ")");
    observability::increment(collaborators_.metrics, "orchestrator.task_assignments");
    publish(protocol::topics::kTaskAssigned,
            protocol::to_json(protocol::TaskAssignedEvent{task, agent_id, agent_name}));
    return agent;
}

core::errors::Result<protocol::WorkflowResult> Orchestrator::execute_workflow(
    const protocol::WorkflowDefinition& workflow) {
    auto run_id = begin_workflow(workflow);
    if (core::errors::is_error(run_id)) {
        return core::errors::get_error(run_id);
    }
    return run_workflow(core::errors::get_value(run_id));
}

core::errors::Status Orchestrator::release_workflow(const std::string& run_id) {
    return run_manager_.release_run(run_id);
}

core::errors::Result<std::string> Orchestrator::begin_workflow(
    const protocol::WorkflowDefinition& workflow) {
    auto plan = runtime::build_plan(workflow);
    if (core::errors::is_error(plan)) {
        const auto& error = core::errors::get_error(plan);
        LOG_ERROR("Orchestrator: workflow '" + workflow.name + "' rejected [" +
                  error.code + "]: " + error.message);
        return error;
    }
    return run_manager_.start_run(
        std::make_shared<const runtime::WorkflowPlan>(core::errors::get_value(plan)));
}

core::errors::Result<protocol::WorkflowResult> Orchestrator::run_workflow(
    const std::string& run_id) {
    auto plan_result = run_manager_.get_plan(run_id);
    if (core::errors::is_error(plan_result)) {
        return core::errors::get_error(plan_result);
    }
    const auto plan = core::errors::get_value(plan_result);
    auto token_result = run_manager_.get_cancel_token(run_id);
    if (core::errors::is_error(token_result)) {
        return core::errors::get_error(token_result);
    }
    const auto cancel_token = core::errors::get_value(token_result);

    auto running = run_manager_.mark_running(run_id);
    if (core::errors::is_error(running)) {
        return core::errors::get_error(running);
    }

    const std::string& name = plan->definition.name;
    LOG_INFO("Orchestrator: starting workflow " + name + " (" +
             protocol::to_string(plan->definition.type) + ", run " + run_id + ")");
    observability::increment(collaborators_.metrics, "workflow." + name + ".started");

    core::errors::Result<protocol::WorkflowResult> executed = [&]() {
        observability::ScopedTimer timer(collaborators_.metrics,
                                         "workflow." + name + ".duration_ms");
        return engine_.execute(*plan, run_id, cancel_token);
    }();
    if (core::errors::is_error(executed)) {
        const auto& error = core::errors::get_error(executed);
        auto failed = run_manager_.mark_failed(run_id, error.message);
        if (core::errors::is_error(failed)) {
            LOG_ERROR("Orchestrator: failed to mark run " + run_id + " as failed: " +
                      core::errors::get_error(failed).message);
        }
        return error;
    }

    const auto& result = core::errors::get_value(executed);
    LOG_INFO("Orchestrator: completed workflow " + name + " (run " + run_id +
             "), success: " + (result.success ? "true" : "false"));
    observability::increment(collaborators_.metrics,
                             "workflow." + name + (result.success ? ".succeeded" : ".failed"));

    if (!cancel_token->load()) {
        auto marked = result.success
                          ? run_manager_.mark_completed(run_id)
                          : run_manager_.mark_failed(run_id, result.errors.front());
        if (core::errors::is_error(marked)) {
            LOG_WARN("Orchestrator: run " + run_id + " state not updated: " +
                     core::errors::get_error(marked).message);
        }
    }

    publish(protocol::topics::kWorkflowCompleted,
            protocol::to_json(protocol::WorkflowCompletedEvent{
                run_id, name, result.success, result.errors.size()}));
    return executed;
}

core::errors::Result<session::RunState> Orchestrator::cancel_workflow(
    const std::string& run_id) {
    LOG_INFO("Orchestrator: cancelling run " + run_id);
    return run_manager_.cancel_run(run_id);
}

core::errors::Result<session::RunState> Orchestrator::workflow_state(
    const std::string& run_id) const {
    return run_manager_.get_run_state(run_id);
}

}  // namespace maestro::orchestrator
