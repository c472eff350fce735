#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "core/config/orchestrator_config.hpp"
#include "core/errors/orchestration_errors.hpp"
#include "protocol/workflow_contract.hpp"
#include "registry/agent_registry.hpp"
#include "runtime/step_executor.hpp"
#include "runtime/workflow_plan.hpp"
#include "selection/agent_selector.hpp"

namespace maestro::runtime {

// Drives a validated workflow plan with one strategy per workflow type.
//
// Dependency policy for Sequential and Hierarchical workflows: a step whose
// dependency has not completed successfully is failed without calling an agent.
// Parallel workflows ignore dependencies (steps run with an empty context);
// Conditional workflows gate on the step's condition instead.
//
// Every step that completes, including synthesized failures (no candidate agent,
// unsatisfied dependency, workflow deadline), appears in `results`, and each
// failure adds one line to `errors`. Steps never started appear in neither.
class WorkflowEngine {
public:
    WorkflowEngine(const registry::AgentRegistry& registry,
                   const selection::AgentSelector& selector,
                   const StepExecutor& executor,
                   core::config::OrchestratorConfig config);

    // Fails only with Configuration errors; step failures are reported in the result.
    core::errors::Result<protocol::WorkflowResult> execute(
        const protocol::WorkflowDefinition& definition, const std::string& run_id,
        CancelToken cancel_token = nullptr) const;

    core::errors::Result<protocol::WorkflowResult> execute(
        const WorkflowPlan& plan, const std::string& run_id,
        CancelToken cancel_token = nullptr) const;

private:
    struct RunContext;

    void run_sequential(const WorkflowPlan& plan, RunContext& run) const;
    void run_parallel(const WorkflowPlan& plan, RunContext& run) const;
    void run_conditional(const WorkflowPlan& plan, RunContext& run) const;
    void run_hierarchical(const WorkflowPlan& plan, RunContext& run) const;

    void visit_hierarchy(const WorkflowPlan& plan, std::size_t index, RunContext& run,
                         std::vector<protocol::StepOutcome>& siblings) const;

    protocol::StepOutcome attempt_step(const WorkflowPlan& plan, std::size_t index,
                                       const StepContext& context,
                                       const RunContext& run) const;

    static std::optional<std::string> unsatisfied_dependency(const WorkflowPlan& plan,
                                                             std::size_t index,
                                                             const StepContext& context);

    const registry::AgentRegistry& registry_;
    const selection::AgentSelector& selector_;
    const StepExecutor& executor_;
    core::config::OrchestratorConfig config_;
};

}  // namespace maestro::runtime
