#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/orchestration_errors.hpp"
#include "protocol/workflow_contract.hpp"

namespace maestro::session {

// Append-only JSON-lines record of a workflow run, one file per run id.
class WorkflowJournal {
public:
    explicit WorkflowJournal(std::filesystem::path root,
                             std::filesystem::path journal_subdir = ".maestro_runs");

    core::errors::Result<std::filesystem::path> write_workflow(
        const std::string& run_id, const protocol::WorkflowDefinition& workflow) const;

    // `step_event` is a workflow.step.completed payload.
    core::errors::Result<std::filesystem::path> write_step(
        const std::string& run_id, const nlohmann::json& step_event) const;

    core::errors::Result<std::filesystem::path> write_final(
        const std::string& run_id, const protocol::WorkflowResult& result) const;

    core::errors::Result<std::filesystem::path> journal_path(
        const std::string& run_id) const;

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& run_id, const std::string& event_json) const;

    std::filesystem::path root_;
    std::filesystem::path journal_subdir_;
};

}  // namespace maestro::session
