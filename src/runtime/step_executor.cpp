#include "runtime/step_executor.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <thread>
#include <utility>
#include <variant>
#include "core/logging/logger.hpp"
#include "protocol/event_contract.hpp"

namespace maestro::runtime {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;
using core::errors::Result;
using protocol::Action;
using protocol::ActionResult;

namespace {

constexpr std::chrono::milliseconds kPollInterval{10};

// Calls into the agent on the current thread. With a deadline set the call runs
// on a detached worker instead, polled against the deadline and cancel token; a
// call that overruns is abandoned there and its eventual result discarded.
template <typename T, typename Call>
Result<T> call_agent(Call call, const StepControl& control, const ErrorCategory category,
                     const std::string& what) {
    if (!control.deadline.has_value()) {
        return core::errors::capture<T>(call, category, what);
    }

    auto task = std::make_shared<std::packaged_task<Result<T>()>>(
        [call = std::move(call), category, what]() {
            return core::errors::capture<T>(call, category, what);
        });
    auto future = task->get_future();
    std::thread([task]() { (*task)(); }).detach();

    const auto deadline = control.deadline.value();
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        const auto wait =
            std::max(std::chrono::milliseconds(0), std::min(kPollInterval, remaining));
        if (future.wait_for(wait) == std::future_status::ready) {
            return future.get();
        }
        if (control.cancelled()) {
            return OrchestrationError{ErrorCategory::Cancelled,
                                      what + " cancelled", "cancelled"};
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return OrchestrationError{ErrorCategory::Timeout,
                                      what + " exceeded its deadline", "timeout"};
        }
    }
}

}  // namespace

StepExecutor::StepExecutor(events::EventBus* event_bus,
                           observability::MetricsSink* metrics,
                           const bool publish_step_events)
    : event_bus_(event_bus),
      metrics_(metrics),
      publish_step_events_(publish_step_events) {}

protocol::EnvironmentState StepExecutor::build_environment(
    const protocol::WorkflowStep& step, const StepContext& context) {
    protocol::EnvironmentState state;
    state.properties = step.parameters;
    for (const auto& dependency : step.dependencies) {
        const auto it = context.find(dependency);
        if (it != context.end()) {
            state.properties["dep_" + dependency] = protocol::to_json(it->second);
        }
    }
    return state;
}

ActionResult StepExecutor::execute_step(const registry::AgentPtr& agent,
                                        const protocol::WorkflowStep& step,
                                        const StepContext& context,
                                        const StepControl& control) const {
    observability::ScopedTimer timer(metrics_, "step." + step.name + ".duration_ms");

    auto fail = [this, &step](const OrchestrationError& error) {
        LOG_WARN("StepExecutor: step " + step.name + " failed [" + error.code +
                 "]: " + error.message);
        observability::increment(metrics_, "step." + step.name + ".failed");
        return ActionResult::failed(error.message);
    };

    const auto identified = core::errors::capture<std::string>(
        [&agent]() { return agent->id(); }, ErrorCategory::Selection,
        "Agent identity for step " + step.name);
    if (core::errors::is_error(identified)) {
        return fail(core::errors::get_error(identified));
    }
    const std::string agent_id = core::errors::get_value(identified);
    LOG_DEBUG("StepExecutor: step " + step.name + " starting on agent " + agent_id);

    if (control.cancelled()) {
        return fail(OrchestrationError{ErrorCategory::Cancelled,
                                       "Step " + step.name + " cancelled before decision",
                                       "cancelled"});
    }

    const protocol::EnvironmentState state = build_environment(step, context);
    auto decided = call_agent<Action>(
        [agent, state]() { return agent->decide_action(state); }, control,
        ErrorCategory::Decision, "Agent " + agent_id + " decision for step " + step.name);
    if (core::errors::is_error(decided)) {
        return fail(core::errors::get_error(decided));
    }
    const Action action = core::errors::get_value(decided);

    if (control.cancelled()) {
        return fail(OrchestrationError{ErrorCategory::Cancelled,
                                       "Step " + step.name + " cancelled before execution",
                                       "cancelled"});
    }

    const auto started = std::chrono::steady_clock::now();
    auto executed = call_agent<ActionResult>(
        [agent, action]() { return agent->execute(action); }, control,
        ErrorCategory::Execution,
        "Action " + action.action_type + " for step " + step.name);
    if (core::errors::is_error(executed)) {
        return fail(core::errors::get_error(executed));
    }

    ActionResult result = core::errors::get_value(executed);
    if (result.execution_time.count() == 0) {
        result.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
    }

    if (control.cancelled()) {
        return fail(OrchestrationError{ErrorCategory::Cancelled,
                                       "Step " + step.name + " cancelled before publication",
                                       "cancelled"});
    }
    publish_completion(control.run_id, step, agent_id, action, result);

    if (result.success) {
        LOG_DEBUG("StepExecutor: step " + step.name + " succeeded: " + result.message);
    } else {
        LOG_WARN("StepExecutor: step " + step.name + " failed: " + result.message);
        observability::increment(metrics_, "step." + step.name + ".failed");
    }
    return result;
}

void StepExecutor::publish_completion(const std::string& run_id,
                                      const protocol::WorkflowStep& step,
                                      const std::string& agent_id,
                                      const Action& action,
                                      const ActionResult& result) const {
    if (event_bus_ == nullptr || !publish_step_events_) {
        return;
    }

    const protocol::StepCompletedEvent event{run_id, step.name, agent_id, action, result};
    const auto published = core::errors::capture<std::monostate>(
        [this, &event]() {
            return event_bus_->publish(protocol::topics::kStepCompleted,
                                       protocol::to_json(event));
        },
        ErrorCategory::Internal, "Event bus", "publish_failed");
    if (core::errors::is_error(published)) {
        LOG_WARN("StepExecutor: failed to publish completion of step " + step.name +
                 ": " + core::errors::get_error(published).message);
    }
}

}  // namespace maestro::runtime
