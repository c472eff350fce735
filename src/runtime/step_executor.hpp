#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include "events/event_bus.hpp"
#include "observability/metrics.hpp"
#include "protocol/agent_contract.hpp"
#include "protocol/workflow_contract.hpp"
#include "registry/agent_registry.hpp"

namespace maestro::runtime {

using CancelToken = std::shared_ptr<std::atomic_bool>;
using StepContext = std::map<std::string, protocol::ActionResult>;

// Per-call limits. Without a deadline the agent is called inline on the current
// thread; the token is then checked only between calls, so an in-flight call
// runs to completion before cancellation takes effect.
struct StepControl {
    std::string run_id;
    CancelToken cancel_token;
    std::optional<std::chrono::steady_clock::time_point> deadline;

    bool cancelled() const { return cancel_token && cancel_token->load(); }
};

class StepExecutor {
public:
    StepExecutor(events::EventBus* event_bus, observability::MetricsSink* metrics,
                 bool publish_step_events = true);

    // Never throws for agent failures: decision errors, execution errors, agent
    // exceptions, timeouts and cancellation all come back as a failed result.
    protocol::ActionResult execute_step(const registry::AgentPtr& agent,
                                        const protocol::WorkflowStep& step,
                                        const StepContext& context,
                                        const StepControl& control) const;

    // Step parameters plus one "dep_<name>" entry per dependency found in `context`.
    static protocol::EnvironmentState build_environment(const protocol::WorkflowStep& step,
                                                        const StepContext& context);

private:
    void publish_completion(const std::string& run_id, const protocol::WorkflowStep& step,
                            const std::string& agent_id,
                            const protocol::Action& action,
                            const protocol::ActionResult& result) const;

    events::EventBus* event_bus_;
    observability::MetricsSink* metrics_;
    bool publish_step_events_;
};

}  // namespace maestro::runtime
