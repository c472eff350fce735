#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/orchestration_errors.hpp"
#include "core/logging/logger.hpp"

namespace maestro::core::config {

// Zero values mean "no limit", which reproduces the unbounded default behaviour.
struct OrchestratorConfig {
    std::uint32_t step_timeout_ms = 0;
    std::uint32_t workflow_timeout_ms = 0;
    std::uint32_t max_parallel_steps = 0;
    // Finished runs kept queryable by run id; older ones are dropped first.
    std::uint32_t retained_runs = 100;
    bool publish_step_events = true;
    logging::LogLevel log_level = logging::LogLevel::INFO;
};

errors::Result<OrchestratorConfig> parse_config(const nlohmann::json& document);

errors::Result<OrchestratorConfig> load_config(const std::filesystem::path& path);

}  // namespace maestro::core::config
