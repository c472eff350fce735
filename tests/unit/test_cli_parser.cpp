#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "test_support.hpp"

namespace {

using maestro::app::cli::parse_and_validate;
using maestro::app::cli::RunOptions;
using maestro::core::errors::ErrorCategory;
using maestro::core::errors::get_error;
using maestro::core::errors::get_value;
using maestro::core::errors::is_error;
using maestro::testing::TempWorkspace;

maestro::core::errors::Result<RunOptions> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("maestro");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

std::string touch(const std::filesystem::path& path) {
    std::ofstream out(path);
    out << "{}";
    return path.string();
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, FailsWhenWorkflowMissing) {
    auto result = parse_tokens({"run"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenFlagValueMissing) {
    auto result = parse_tokens({"run", "--workflow"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownArgument) {
    auto result = parse_tokens({"run", "--task", "fix issue"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenFilesDoNotExist) {
    TempWorkspace workspace;
    const std::string workflow = touch(workspace.root() / "wf.json");

    auto missing_workflow =
        parse_tokens({"run", "--workflow", (workspace.root() / "nope.json").string()});
    ASSERT_TRUE(is_error(missing_workflow));
    EXPECT_EQ(get_error(missing_workflow).code, "invalid_path");

    auto missing_config = parse_tokens(
        {"run", "--workflow", workflow, "--config", (workspace.root() / "nope.json").string()});
    ASSERT_TRUE(is_error(missing_config));
    EXPECT_EQ(get_error(missing_config).code, "invalid_path");

    auto missing_dir = parse_tokens({"run", "--workflow", workflow, "--journal-dir",
                                     (workspace.root() / "no-dir").string()});
    ASSERT_TRUE(is_error(missing_dir));
    EXPECT_EQ(get_error(missing_dir).code, "invalid_path");
}

TEST(CliParserTest, ParsesFullRunRequest) {
    TempWorkspace workspace;
    const std::string workflow = touch(workspace.root() / "wf.json");
    const std::string config = touch(workspace.root() / "config.json");

    auto result = parse_tokens({"run", "--workflow", workflow, "--config", config,
                                "--journal-dir", workspace.root().string(), "--verbose"});
    ASSERT_FALSE(is_error(result));

    const auto& options = get_value(result);
    EXPECT_EQ(options.workflow_file.string(), workflow);
    ASSERT_TRUE(options.config_file.has_value());
    EXPECT_EQ(options.config_file->string(), config);
    EXPECT_EQ(options.journal_dir, std::filesystem::canonical(workspace.root()));
    EXPECT_TRUE(options.verbose);
}

TEST(CliParserTest, DefaultsWithOnlyWorkflow) {
    TempWorkspace workspace;
    const std::string workflow = touch(workspace.root() / "wf.json");

    auto result = parse_tokens({"run", "--workflow", workflow});
    ASSERT_FALSE(is_error(result));

    const auto& options = get_value(result);
    EXPECT_FALSE(options.config_file.has_value());
    EXPECT_EQ(options.journal_dir, std::filesystem::current_path());
    EXPECT_FALSE(options.verbose);
}

}  // namespace
