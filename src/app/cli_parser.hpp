#pragma once
#include <filesystem>
#include <optional>
#include "core/errors/orchestration_errors.hpp"

namespace maestro::app::cli {

    struct RunOptions {
        std::filesystem::path workflow_file;
        std::optional<std::filesystem::path> config_file;
        std::filesystem::path journal_dir = std::filesystem::current_path();
        bool verbose = false;
    };

    maestro::core::errors::Result<RunOptions> parse_and_validate(int argc, char* argv[]);
}
