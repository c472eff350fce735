#include "session/run_manager.hpp"
#include <algorithm>
#include <utility>
#include "core/config/run_id.hpp"
#include "core/logging/logger.hpp"

namespace maestro::session {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;

namespace {

OrchestrationError run_not_found(const std::string& run_id) {
    return OrchestrationError{ErrorCategory::Input, "Run ID not found: " + run_id,
                              "run_not_found"};
}

}  // namespace

RunManager::RunManager(const std::size_t max_retained_runs)
    : max_retained_runs_(max_retained_runs) {}

bool RunManager::is_terminal(const RunState state) {
    return state == RunState::Completed || state == RunState::Failed ||
           state == RunState::Cancelled;
}

std::string RunManager::to_string(const RunState state) {
    switch (state) {
        case RunState::Created:
            return "created";
        case RunState::Running:
            return "running";
        case RunState::Completed:
            return "completed";
        case RunState::Failed:
            return "failed";
        case RunState::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

core::errors::Result<std::string> RunManager::start_run(
    std::shared_ptr<const runtime::WorkflowPlan> plan) {
    if (!plan) {
        return OrchestrationError{ErrorCategory::Internal,
                                  "Run must reference a workflow plan.",
                                  "invalid_run_request"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const std::string run_id = core::config::generate_run_id();
        if (runs_.find(run_id) != runs_.end()) {
            continue;
        }

        RunRecord record;
        record.run_id = run_id;
        record.plan = plan;
        record.state = RunState::Created;
        record.cancel_token = std::make_shared<std::atomic_bool>(false);
        runs_.emplace(run_id, std::move(record));
        LOG_INFO("RunManager: run " + run_id + " created for workflow " +
                 plan->definition.name);
        return run_id;
    }

    return OrchestrationError{ErrorCategory::Internal,
                              "Unable to allocate unique run ID.",
                              "run_id_generation_failed"};
}

core::errors::Result<RunState> RunManager::mark_running(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return run_not_found(run_id);
    }
    if (it->second.state != RunState::Created) {
        return OrchestrationError{ErrorCategory::Input,
                                  "Run cannot start from state: " +
                                      to_string(it->second.state),
                                  "invalid_state_transition"};
    }

    it->second.state = RunState::Running;
    LOG_INFO("RunManager: run " + run_id + " transition created -> running");
    return it->second.state;
}

core::errors::Result<RunState> RunManager::cancel_run(const std::string& run_id) {
    return transition_to_terminal(run_id, RunState::Cancelled, std::nullopt);
}

core::errors::Result<RunState> RunManager::mark_completed(
    const std::string& run_id) {
    return transition_to_terminal(run_id, RunState::Completed, std::nullopt);
}

core::errors::Result<RunState> RunManager::mark_failed(
    const std::string& run_id, const std::string& reason) {
    return transition_to_terminal(run_id, RunState::Failed, reason);
}

core::errors::Result<RunState> RunManager::transition_to_terminal(
    const std::string& run_id, const RunState next_state,
    const std::optional<std::string>& failure_reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return run_not_found(run_id);
    }

    if (is_terminal(it->second.state)) {
        return OrchestrationError{ErrorCategory::Input,
                                  "Run is already terminal: " +
                                      to_string(it->second.state),
                                  "invalid_state_transition"};
    }

    const std::string prev = to_string(it->second.state);
    it->second.state = next_state;
    it->second.failure_reason = failure_reason;
    if (next_state == RunState::Cancelled && it->second.cancel_token) {
        it->second.cancel_token->store(true);
    }
    LOG_INFO("RunManager: run " + run_id + " transition " + prev + " -> " +
             to_string(next_state));
    retire(run_id);
    return next_state;
}

// Caller holds `mutex_`.
void RunManager::retire(const std::string& run_id) {
    terminal_order_.push_back(run_id);
    if (max_retained_runs_ == 0) {
        return;
    }
    while (terminal_order_.size() > max_retained_runs_) {
        const std::string oldest = terminal_order_.front();
        terminal_order_.pop_front();
        runs_.erase(oldest);
        LOG_DEBUG("RunManager: run " + oldest + " dropped from history");
    }
}

core::errors::Status RunManager::release_run(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return run_not_found(run_id);
    }
    if (!is_terminal(it->second.state)) {
        return OrchestrationError{ErrorCategory::Input,
                                  "Run is still active: " + to_string(it->second.state),
                                  "invalid_state_transition"};
    }

    runs_.erase(it);
    terminal_order_.erase(
        std::remove(terminal_order_.begin(), terminal_order_.end(), run_id),
        terminal_order_.end());
    LOG_DEBUG("RunManager: run " + run_id + " released");
    return core::errors::ok();
}

core::errors::Result<RunState> RunManager::get_run_state(
    const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return run_not_found(run_id);
    }
    return it->second.state;
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> RunManager::get_cancel_token(
    const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return run_not_found(run_id);
    }
    return it->second.cancel_token;
}

core::errors::Result<std::shared_ptr<const runtime::WorkflowPlan>> RunManager::get_plan(
    const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return run_not_found(run_id);
    }
    return it->second.plan;
}

std::size_t RunManager::run_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runs_.size();
}

}  // namespace maestro::session
