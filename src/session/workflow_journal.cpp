#include "session/workflow_journal.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <utility>

namespace maestro::session {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

json make_event(const std::string& kind, const std::string& run_id, json payload) {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = kind;
    event["run_id"] = run_id;
    event["payload"] = std::move(payload);
    return event;
}

}  // namespace

WorkflowJournal::WorkflowJournal(std::filesystem::path root,
                                 std::filesystem::path journal_subdir)
    : root_(std::move(root)), journal_subdir_(std::move(journal_subdir)) {}

core::errors::Result<std::filesystem::path> WorkflowJournal::journal_path(
    const std::string& run_id) const {
    if (run_id.empty()) {
        return OrchestrationError{ErrorCategory::Input, "Run ID cannot be empty.",
                                  "invalid_run_id"};
    }

    std::error_code ec;
    if (!std::filesystem::exists(root_, ec) || ec) {
        return OrchestrationError{ErrorCategory::Input,
                                  "Journal root does not exist: " + root_.string(),
                                  "invalid_journal_root"};
    }
    if (!std::filesystem::is_directory(root_, ec) || ec) {
        return OrchestrationError{ErrorCategory::Input,
                                  "Journal root is not a directory: " + root_.string(),
                                  "invalid_journal_root"};
    }

    const auto canonical_root = std::filesystem::weakly_canonical(root_, ec);
    if (ec) {
        return OrchestrationError{ErrorCategory::Input,
                                  "Unable to resolve journal root: " + root_.string(),
                                  "invalid_journal_root"};
    }

    auto journal_dir = canonical_root / journal_subdir_;
    std::filesystem::create_directories(journal_dir, ec);
    if (ec) {
        return OrchestrationError{ErrorCategory::Internal,
                                  "Unable to create journal directory: " +
                                      journal_dir.string(),
                                  "journal_dir_create_failed"};
    }

    return journal_dir / (run_id + ".jsonl");
}

core::errors::Result<std::filesystem::path> WorkflowJournal::append_event(
    const std::string& run_id, const std::string& event_json) const {
    auto path_result = journal_path(run_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return OrchestrationError{ErrorCategory::Internal,
                                  "Unable to open journal file: " + path.string(),
                                  "journal_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return OrchestrationError{ErrorCategory::Internal,
                                  "Unable to write journal event: " + path.string(),
                                  "journal_write_failed"};
    }

    return path;
}

core::errors::Result<std::filesystem::path> WorkflowJournal::write_workflow(
    const std::string& run_id, const protocol::WorkflowDefinition& workflow) const {
    return append_event(run_id,
                        make_event("workflow", run_id, protocol::to_json(workflow)).dump());
}

core::errors::Result<std::filesystem::path> WorkflowJournal::write_step(
    const std::string& run_id, const json& step_event) const {
    return append_event(run_id, make_event("step", run_id, step_event).dump());
}

core::errors::Result<std::filesystem::path> WorkflowJournal::write_final(
    const std::string& run_id, const protocol::WorkflowResult& result) const {
    json results = json::object();
    for (const auto& [name, outcome] : result.results) {
        results[name] = protocol::to_json(outcome);
    }

    json payload;
    payload["workflow_name"] = result.workflow_name;
    payload["success"] = result.success;
    payload["results"] = results;
    payload["errors"] = result.errors;
    return append_event(run_id, make_event("final", run_id, payload).dump());
}

}  // namespace maestro::session
