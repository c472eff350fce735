#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include "app/cli_parser.hpp"
#include "app/scripted_agent.hpp"
#include "app/workflow_loader.hpp"
#include "core/config/orchestrator_config.hpp"
#include "core/config/run_id.hpp"
#include "core/errors/orchestration_errors.hpp"
#include "core/logging/logger.hpp"
#include "events/event_bus.hpp"
#include "observability/metrics.hpp"
#include "orchestrator/orchestrator.hpp"
#include "policy/safety_validator.hpp"
#include "protocol/event_contract.hpp"
#include "registry/agent_registry.hpp"
#include "session/run_manager.hpp"
#include "session/workflow_journal.hpp"

namespace {

constexpr int kExitWorkflowFailed = 1;
constexpr int kExitInputError = 2;
constexpr int kExitConfigurationError = 3;
constexpr int kExitJournalError = 6;

void report(const std::string& what, const maestro::core::errors::OrchestrationError& err) {
    LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

int exit_code_for(const maestro::core::errors::OrchestrationError& err) {
    return err.category == maestro::core::errors::ErrorCategory::Configuration
               ? kExitConfigurationError
               : kExitInputError;
}

void print_outcome(const maestro::protocol::StepOutcome& outcome, const std::string& indent) {
    LOG_INFO(indent + "Step " + outcome.step_name +
             (outcome.agent_id.empty() ? "" : " (" + outcome.agent_id + ")") + ": " +
             (outcome.result.success ? "ok" : "failed") + " - " + outcome.result.message);
    for (const auto& child : outcome.children) {
        print_outcome(child, indent + "  ");
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Tag bootstrap logging until the workflow run has its own ID
    maestro::core::logging::Logger::get().set_run_id(
        maestro::core::config::generate_run_id("boot-"));

    // 2. Parse CLI input and return normalized input errors
    auto parsed = maestro::app::cli::parse_and_validate(argc, argv);
    if (maestro::core::errors::is_error(parsed)) {
        report("Input error", maestro::core::errors::get_error(parsed));
        return kExitInputError;
    }
    const auto& options = maestro::core::errors::get_value(parsed);

    // 3. Configuration
    maestro::core::config::OrchestratorConfig config;
    if (options.config_file.has_value()) {
        auto loaded = maestro::core::config::load_config(options.config_file.value());
        if (maestro::core::errors::is_error(loaded)) {
            report("Configuration error", maestro::core::errors::get_error(loaded));
            return kExitConfigurationError;
        }
        config = maestro::core::errors::get_value(loaded);
    }
    maestro::core::logging::Logger::get().set_min_level(
        options.verbose ? maestro::core::logging::LogLevel::DEBUG : config.log_level);

    // 4. Workflow file
    auto file = maestro::app::load_workflow_file(options.workflow_file);
    if (maestro::core::errors::is_error(file)) {
        const auto& err = maestro::core::errors::get_error(file);
        report("Workflow file rejected", err);
        return exit_code_for(err);
    }
    const auto& workflow_file = maestro::core::errors::get_value(file);

    // 5. Wire the orchestrator
    maestro::registry::AgentRegistry registry;
    maestro::events::InMemoryEventBus event_bus;
    maestro::observability::InMemoryMetrics metrics;
    maestro::policy::KeywordSafetyValidator safety_validator;

    maestro::orchestrator::Collaborators collaborators;
    collaborators.event_bus = &event_bus;
    collaborators.metrics = &metrics;
    collaborators.safety_validator = &safety_validator;
    maestro::orchestrator::Orchestrator orchestrator(registry, collaborators, config);

    for (const auto& profile : workflow_file.agents) {
        orchestrator.register_agent(std::make_shared<maestro::app::ScriptedAgent>(profile));
    }

    auto begun = orchestrator.begin_workflow(workflow_file.workflow);
    if (maestro::core::errors::is_error(begun)) {
        const auto& err = maestro::core::errors::get_error(begun);
        report("Workflow rejected", err);
        return exit_code_for(err);
    }
    const std::string run_id = maestro::core::errors::get_value(begun);
    maestro::core::logging::Logger::get().set_run_id(run_id);

    // 6. Journal: definition first, then one line per completed step
    maestro::session::WorkflowJournal journal(options.journal_dir);
    auto journal_started = journal.write_workflow(run_id, workflow_file.workflow);
    if (maestro::core::errors::is_error(journal_started)) {
        report("Failed to write workflow journal", maestro::core::errors::get_error(journal_started));
        return kExitJournalError;
    }

    std::mutex journal_mutex;
    std::atomic_bool journal_failed{false};
    event_bus.subscribe(maestro::protocol::topics::kStepCompleted,
                        [&](const std::string&, const nlohmann::json& payload) {
                            if (payload.value("run_id", std::string()) != run_id) {
                                return;
                            }
                            std::lock_guard<std::mutex> lock(journal_mutex);
                            auto written = journal.write_step(run_id, payload);
                            if (maestro::core::errors::is_error(written)) {
                                report("Failed to write step journal",
                                       maestro::core::errors::get_error(written));
                                journal_failed.store(true);
                            }
                        });

    // 7. Run
    auto executed = orchestrator.run_workflow(run_id);
    if (maestro::core::errors::is_error(executed)) {
        const auto& err = maestro::core::errors::get_error(executed);
        report("Workflow run failed", err);
        return exit_code_for(err);
    }
    const auto& result = maestro::core::errors::get_value(executed);

    for (const auto& entry : result.results) {
        print_outcome(entry.second, "");
    }
    for (const auto& error : result.errors) {
        LOG_WARN(error);
    }

    auto state = orchestrator.workflow_state(run_id);
    if (!maestro::core::errors::is_error(state)) {
        LOG_INFO("Final run state: " +
                 maestro::session::RunManager::to_string(maestro::core::errors::get_value(state)));
    }
    LOG_DEBUG("Metrics: " + metrics.snapshot().dump());

    auto journal_final = journal.write_final(run_id, result);
    if (maestro::core::errors::is_error(journal_final)) {
        report("Failed to write final journal", maestro::core::errors::get_error(journal_final));
        return kExitJournalError;
    }
    if (journal_failed.load()) {
        return kExitJournalError;
    }
    LOG_INFO("Journal: " + maestro::core::errors::get_value(journal_final).string());

    return result.success ? 0 : kExitWorkflowFailed;
}
