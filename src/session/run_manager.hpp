#pragma once

#include <cstddef>
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/errors/orchestration_errors.hpp"
#include "runtime/workflow_plan.hpp"

namespace maestro::session {

enum class RunState {
    Created,
    Running,
    Completed,
    Failed,
    Cancelled
};

struct RunRecord {
    std::string run_id;
    std::shared_ptr<const runtime::WorkflowPlan> plan;
    RunState state = RunState::Created;
    std::optional<std::string> failure_reason;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// Tracks workflow runs: Created -> Running -> {Completed, Failed, Cancelled}.
// A run may be cancelled while Created or Running; cancelling sets its token.
//
// At most `max_retained_runs` terminal runs are kept (0 keeps all); the oldest
// terminal run is dropped first. Active runs are never dropped.
class RunManager {
public:
    explicit RunManager(std::size_t max_retained_runs = 0);

    core::errors::Result<std::string> start_run(
        std::shared_ptr<const runtime::WorkflowPlan> plan);
    core::errors::Result<RunState> mark_running(const std::string& run_id);
    core::errors::Result<RunState> cancel_run(const std::string& run_id);
    core::errors::Result<RunState> mark_completed(const std::string& run_id);
    core::errors::Result<RunState> mark_failed(const std::string& run_id,
                                               const std::string& reason);

    core::errors::Result<RunState> get_run_state(const std::string& run_id) const;
    core::errors::Result<std::shared_ptr<std::atomic_bool>> get_cancel_token(
        const std::string& run_id) const;
    core::errors::Result<std::shared_ptr<const runtime::WorkflowPlan>> get_plan(
        const std::string& run_id) const;

    // Drops a terminal run. Fails for an unknown or still active run.
    core::errors::Status release_run(const std::string& run_id);

    std::size_t run_count() const;

    static std::string to_string(RunState state);

private:
    core::errors::Result<RunState> transition_to_terminal(
        const std::string& run_id, RunState next_state,
        const std::optional<std::string>& failure_reason);
    static bool is_terminal(RunState state);
    void retire(const std::string& run_id);

    std::size_t max_retained_runs_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RunRecord> runs_;
    std::deque<std::string> terminal_order_;
};

}  // namespace maestro::session
