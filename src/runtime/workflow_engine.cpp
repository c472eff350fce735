#include "runtime/workflow_engine.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <thread>
#include <utility>
#include "core/logging/logger.hpp"

namespace maestro::runtime {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;
using protocol::ActionResult;
using protocol::StepOutcome;
using protocol::WorkflowType;

struct WorkflowEngine::RunContext {
    protocol::WorkflowResult result;
    StepContext context;
    std::vector<bool> completed;
    CancelToken cancel_token;
    std::optional<std::chrono::steady_clock::time_point> workflow_deadline;
    std::uint32_t step_timeout_ms = 0;
    std::mutex mutex;
    bool cancellation_noted = false;

    bool cancelled() const { return cancel_token && cancel_token->load(); }

    bool past_deadline() const {
        return workflow_deadline.has_value() &&
               std::chrono::steady_clock::now() >= workflow_deadline.value();
    }

    StepControl control() const {
        StepControl control;
        control.run_id = result.run_id;
        control.cancel_token = cancel_token;
        control.deadline = workflow_deadline;
        if (step_timeout_ms > 0) {
            const auto step_deadline = std::chrono::steady_clock::now() +
                                       std::chrono::milliseconds(step_timeout_ms);
            if (!control.deadline.has_value() || step_deadline < control.deadline.value()) {
                control.deadline = step_deadline;
            }
        }
        return control;
    }

    // Not thread-safe; parallel callers hold `mutex`.
    void record_error(const StepOutcome& outcome) {
        if (!outcome.result.success) {
            result.errors.push_back("Error in step " + outcome.step_name + ": " +
                                    outcome.result.message);
        }
    }

    void note_cancelled(const std::string& next_step) {
        if (cancellation_noted) {
            return;
        }
        cancellation_noted = true;
        LOG_WARN("WorkflowEngine: run " + result.run_id + " cancelled before step " +
                 next_step);
        result.errors.push_back("Workflow cancelled before step " + next_step);
    }
};

WorkflowEngine::WorkflowEngine(const registry::AgentRegistry& registry,
                               const selection::AgentSelector& selector,
                               const StepExecutor& executor,
                               core::config::OrchestratorConfig config)
    : registry_(registry),
      selector_(selector),
      executor_(executor),
      config_(std::move(config)) {}

core::errors::Result<protocol::WorkflowResult> WorkflowEngine::execute(
    const protocol::WorkflowDefinition& definition, const std::string& run_id,
    CancelToken cancel_token) const {
    auto plan = build_plan(definition);
    if (core::errors::is_error(plan)) {
        return core::errors::get_error(plan);
    }
    return execute(core::errors::get_value(plan), run_id, std::move(cancel_token));
}

core::errors::Result<protocol::WorkflowResult> WorkflowEngine::execute(
    const WorkflowPlan& plan, const std::string& run_id, CancelToken cancel_token) const {
    RunContext run;
    run.result.workflow_name = plan.definition.name;
    run.result.run_id = run_id;
    run.cancel_token = std::move(cancel_token);
    run.step_timeout_ms = config_.step_timeout_ms;
    run.completed.assign(plan.definition.steps.size(), false);
    if (config_.workflow_timeout_ms > 0) {
        run.workflow_deadline = std::chrono::steady_clock::now() +
                                std::chrono::milliseconds(config_.workflow_timeout_ms);
    }

    switch (plan.definition.type) {
        case WorkflowType::Sequential:
            run_sequential(plan, run);
            break;
        case WorkflowType::Parallel:
            run_parallel(plan, run);
            break;
        case WorkflowType::Conditional:
            run_conditional(plan, run);
            break;
        case WorkflowType::Hierarchical:
            run_hierarchical(plan, run);
            break;
        default:
            return OrchestrationError{ErrorCategory::Configuration,
                                      "Unknown workflow type for workflow '" +
                                          plan.definition.name + "'",
                                      "unknown_workflow_type"};
    }

    run.result.success = run.result.errors.empty();
    return std::move(run.result);
}

std::optional<std::string> WorkflowEngine::unsatisfied_dependency(
    const WorkflowPlan& plan, const std::size_t index, const StepContext& context) {
    for (const auto dependency : plan.dependencies[index]) {
        const auto& name = plan.step(dependency).name;
        const auto it = context.find(name);
        if (it == context.end() || !it->second.success) {
            return name;
        }
    }
    return std::nullopt;
}

StepOutcome WorkflowEngine::attempt_step(const WorkflowPlan& plan, const std::size_t index,
                                         const StepContext& context,
                                         const RunContext& run) const {
    const auto& step = plan.step(index);
    StepOutcome outcome;
    outcome.step_name = step.name;

    if (run.past_deadline()) {
        outcome.result = ActionResult::failed("Workflow deadline exceeded before step " +
                                              step.name);
        LOG_WARN("WorkflowEngine: " + outcome.result.message);
        return outcome;
    }

    const auto candidates = registry_.agents_of_type(step.required_agent_type);
    auto selected =
        selector_.select_best_agent(selection::AgentSelector::describe_step(step), candidates);
    if (core::errors::is_error(selected)) {
        const auto& error = core::errors::get_error(selected);
        outcome.result = ActionResult::failed(
            error.code == "no_candidate"
                ? "No agent of type " + protocol::to_string(step.required_agent_type) +
                      " available for step " + step.name
                : error.message);
        LOG_WARN("WorkflowEngine: " + outcome.result.message);
        return outcome;
    }

    const auto& agent = core::errors::get_value(selected);
    const auto identified = core::errors::capture<std::string>(
        [&agent]() { return agent->id(); }, ErrorCategory::Selection,
        "Agent identity for step " + step.name);
    if (core::errors::is_error(identified)) {
        outcome.result = ActionResult::failed(core::errors::get_error(identified).message);
        LOG_WARN("WorkflowEngine: " + outcome.result.message);
        return outcome;
    }
    outcome.agent_id = core::errors::get_value(identified);
    outcome.result = executor_.execute_step(agent, step, context, run.control());
    return outcome;
}

void WorkflowEngine::run_sequential(const WorkflowPlan& plan, RunContext& run) const {
    for (std::size_t i = 0; i < plan.definition.steps.size(); ++i) {
        const auto& step = plan.step(i);
        if (run.cancelled()) {
            run.note_cancelled(step.name);
            return;
        }

        StepOutcome outcome;
        const auto missing = unsatisfied_dependency(plan, i, run.context);
        if (missing.has_value()) {
            outcome.step_name = step.name;
            outcome.result = ActionResult::failed("Dependency not satisfied: " +
                                                  missing.value());
            LOG_WARN("WorkflowEngine: step " + step.name + " not run, dependency " +
                     missing.value() + " not satisfied");
        } else {
            outcome = attempt_step(plan, i, run.context, run);
        }

        run.context[step.name] = outcome.result;
        run.record_error(outcome);
        const bool succeeded = outcome.result.success;
        run.result.results[step.name] = std::move(outcome);
        if (!succeeded) {
            LOG_WARN("WorkflowEngine: sequential workflow stopped at step " + step.name);
            return;
        }
    }
}

void WorkflowEngine::run_parallel(const WorkflowPlan& plan, RunContext& run) const {
    const std::size_t step_count = plan.definition.steps.size();
    if (step_count == 0) {
        return;
    }
    for (std::size_t i = 0; i < step_count; ++i) {
        if (!plan.dependencies[i].empty()) {
            LOG_WARN("WorkflowEngine: dependencies of parallel step " + plan.step(i).name +
                     " are ignored");
        }
    }

    std::size_t worker_count = step_count;
    if (config_.max_parallel_steps > 0) {
        worker_count = std::min<std::size_t>(worker_count, config_.max_parallel_steps);
    }

    const StepContext empty_context;
    std::atomic<std::size_t> next_step{0};
    auto worker = [&]() {
        while (true) {
            const std::size_t i = next_step.fetch_add(1);
            if (i >= step_count) {
                return;
            }
            if (run.cancelled()) {
                std::lock_guard<std::mutex> lock(run.mutex);
                run.note_cancelled(plan.step(i).name);
                continue;
            }

            StepOutcome outcome = attempt_step(plan, i, empty_context, run);
            std::lock_guard<std::mutex> lock(run.mutex);
            run.record_error(outcome);
            run.result.results[outcome.step_name] = std::move(outcome);
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (std::size_t w = 0; w < worker_count; ++w) {
        workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
        thread.join();
    }
}

void WorkflowEngine::run_conditional(const WorkflowPlan& plan, RunContext& run) const {
    for (std::size_t i = 0; i < plan.definition.steps.size(); ++i) {
        const auto& step = plan.step(i);
        if (run.cancelled()) {
            run.note_cancelled(step.name);
            return;
        }

        const auto& condition = plan.conditions[i];
        if (condition.has_value()) {
            const auto verdict = evaluate(condition.value(), run.context);
            if (verdict == ConditionOutcome::DependencyMissing) {
                LOG_DEBUG("WorkflowEngine: skipped step " + step.name + ", " +
                          condition->dependency + " has not run");
                continue;
            }
            if (verdict == ConditionOutcome::NotMet) {
                LOG_DEBUG("WorkflowEngine: skipped step " + step.name +
                          " (condition not met)");
                continue;
            }
        }

        StepOutcome outcome = attempt_step(plan, i, run.context, run);
        run.context[step.name] = outcome.result;
        run.record_error(outcome);
        run.result.results[step.name] = std::move(outcome);
    }
}

void WorkflowEngine::run_hierarchical(const WorkflowPlan& plan, RunContext& run) const {
    for (const auto root : plan.roots) {
        if (run.cancelled()) {
            run.note_cancelled(plan.step(root).name);
            return;
        }

        std::vector<StepOutcome> top;
        visit_hierarchy(plan, root, run, top);
        for (auto& outcome : top) {
            const std::string name = outcome.step_name;
            if (!outcome.subtree_succeeded()) {
                LOG_WARN("WorkflowEngine: subtree under root " + name + " failed");
            }
            run.result.results[name] = std::move(outcome);
        }
    }
}

// A step with several parents runs once, under whichever parent completes last;
// earlier visits find an incomplete dependency and defer.
//
// All roots share the flat `run.context`. Its parents need not be ancestors of
// one branch, so a per-branch context would miss them. Sharing does not leak
// sibling outputs: the environment carries only the step's declared
// dependencies, which are its ancestors.
void WorkflowEngine::visit_hierarchy(const WorkflowPlan& plan, const std::size_t index,
                                     RunContext& run,
                                     std::vector<StepOutcome>& siblings) const {
    if (run.completed[index]) {
        return;
    }
    for (const auto dependency : plan.dependencies[index]) {
        if (!run.completed[dependency]) {
            return;
        }
    }

    const auto& step = plan.step(index);
    if (run.cancelled()) {
        run.note_cancelled(step.name);
        return;
    }

    StepOutcome outcome;
    const auto missing = unsatisfied_dependency(plan, index, run.context);
    if (missing.has_value()) {
        outcome.step_name = step.name;
        outcome.result = ActionResult::failed("Dependency not satisfied: " +
                                              missing.value());
        LOG_WARN("WorkflowEngine: step " + step.name + " not run, dependency " +
                 missing.value() + " not satisfied");
    } else {
        LOG_DEBUG("WorkflowEngine: executing hierarchical step " + step.name);
        outcome = attempt_step(plan, index, run.context, run);
    }

    run.context[step.name] = outcome.result;
    run.completed[index] = true;
    run.record_error(outcome);

    for (const auto child : plan.children[index]) {
        visit_hierarchy(plan, child, run, outcome.children);
    }
    siblings.push_back(std::move(outcome));
}

}  // namespace maestro::runtime
