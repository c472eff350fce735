#include "cli_parser.hpp"
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace maestro::app::cli {

    using namespace maestro::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> workflow;
        std::optional<std::string> config;
        std::optional<std::string> journal_dir;
        bool verbose = false;
    };

    namespace {

        const char* kUsage = "Usage: maestro run --workflow <file> [--config <file>] [--journal-dir <dir>] [--verbose]";

        Result<std::filesystem::path> existing_file(const std::string& raw, const std::string& flag) {
            std::filesystem::path p(raw);
            std::error_code ec;
            const bool is_file = std::filesystem::is_regular_file(p, ec);
            if (ec || !is_file) {
                return OrchestrationError{ErrorCategory::Input, flag + " does not name a readable file: " + raw, "invalid_path"};
            }
            return p;
        }

    }  // namespace

    Result<RunOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return OrchestrationError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        std::string command = argv[1];
        if (command != "run") {
            return OrchestrationError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'run' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'run' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--workflow") {
                if (i + 1 < args.size()) raw.workflow = args[++i];
                else return OrchestrationError{ErrorCategory::Input, "Missing value for --workflow", "missing_value"};
            } else if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config = args[++i];
                else return OrchestrationError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--journal-dir") {
                if (i + 1 < args.size()) raw.journal_dir = args[++i];
                else return OrchestrationError{ErrorCategory::Input, "Missing value for --journal-dir", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return OrchestrationError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", kUsage};
            }
        }

        // 3. Validator Phase: Enforce presence and paths
        RunOptions options;
        options.verbose = raw.verbose;

        if (!raw.workflow.has_value()) {
            return OrchestrationError{ErrorCategory::Input, "Must provide --workflow", "missing_required_flag", kUsage};
        }
        auto workflow = existing_file(raw.workflow.value(), "--workflow");
        if (is_error(workflow)) {
            return get_error(workflow);
        }
        options.workflow_file = get_value(workflow);

        if (raw.config) {
            auto config = existing_file(raw.config.value(), "--config");
            if (is_error(config)) {
                return get_error(config);
            }
            options.config_file = get_value(config);
        }

        if (raw.journal_dir) {
            std::filesystem::path p(raw.journal_dir.value());
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return OrchestrationError{ErrorCategory::Input, "Journal directory does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return OrchestrationError{ErrorCategory::Input, "Failed to canonicalize journal directory", "invalid_path"};
            }
            options.journal_dir = std::move(canonical_path);
        }

        return options;
    }

} // namespace maestro::app::cli
