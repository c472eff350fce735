#include "core/config/orchestrator_config.hpp"

#include <fstream>
#include <limits>

namespace maestro::core::config {

using errors::ErrorCategory;
using errors::OrchestrationError;
using nlohmann::json;

namespace {

OrchestrationError config_error(const std::string& message) {
    return OrchestrationError{ErrorCategory::Configuration, message,
                              "config_parse_failed"};
}

errors::Result<std::uint32_t> read_uint(const json& document, const char* key,
                                        const std::uint32_t fallback) {
    const auto it = document.find(key);
    if (it == document.end()) {
        return fallback;
    }
    const bool in_range =
        it->is_number_unsigned()
            ? it->get<std::uint64_t>() <= std::numeric_limits<std::uint32_t>::max()
            : it->is_number_integer() && it->get<std::int64_t>() >= 0 &&
                  it->get<std::int64_t>() <= std::numeric_limits<std::uint32_t>::max();
    if (!in_range) {
        return config_error(std::string("Expected a non-negative integer for '") +
                            key + "'");
    }
    return static_cast<std::uint32_t>(it->get<std::uint64_t>());
}

}  // namespace

errors::Result<OrchestratorConfig> parse_config(const json& document) {
    if (!document.is_object()) {
        return config_error("Configuration must be a JSON object");
    }

    OrchestratorConfig config;

    auto step_timeout = read_uint(document, "step_timeout_ms", config.step_timeout_ms);
    if (errors::is_error(step_timeout)) {
        return errors::get_error(step_timeout);
    }
    config.step_timeout_ms = errors::get_value(step_timeout);

    auto workflow_timeout =
        read_uint(document, "workflow_timeout_ms", config.workflow_timeout_ms);
    if (errors::is_error(workflow_timeout)) {
        return errors::get_error(workflow_timeout);
    }
    config.workflow_timeout_ms = errors::get_value(workflow_timeout);

    auto max_parallel =
        read_uint(document, "max_parallel_steps", config.max_parallel_steps);
    if (errors::is_error(max_parallel)) {
        return errors::get_error(max_parallel);
    }
    config.max_parallel_steps = errors::get_value(max_parallel);

    auto retained = read_uint(document, "retained_runs", config.retained_runs);
    if (errors::is_error(retained)) {
        return errors::get_error(retained);
    }
    config.retained_runs = errors::get_value(retained);

    if (const auto it = document.find("publish_step_events"); it != document.end()) {
        if (!it->is_boolean()) {
            return config_error("Expected a boolean for 'publish_step_events'");
        }
        config.publish_step_events = it->get<bool>();
    }

    if (const auto it = document.find("log_level"); it != document.end()) {
        if (!it->is_string()) {
            return config_error("Expected a string for 'log_level'");
        }
        const auto level = logging::parse_level(it->get<std::string>());
        if (!level.has_value()) {
            return OrchestrationError{ErrorCategory::Configuration,
                                      "Unknown log level: " + it->get<std::string>(),
                                      "config_parse_failed",
                                      "Use one of debug, info, warn, error."};
        }
        config.log_level = level.value();
    }

    return config;
}

errors::Result<OrchestratorConfig> load_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return OrchestrationError{ErrorCategory::Input,
                                  "Unable to open config file: " + path.string(),
                                  "config_open_failed"};
    }

    json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return config_error("Config file is not valid JSON: " + path.string());
    }
    return parse_config(document);
}

}  // namespace maestro::core::config
