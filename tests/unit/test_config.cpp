#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/orchestrator_config.hpp"
#include "test_support.hpp"

namespace {

using maestro::core::config::load_config;
using maestro::core::config::parse_config;
using maestro::core::errors::ErrorCategory;
using maestro::core::errors::get_error;
using maestro::core::errors::get_value;
using maestro::core::errors::is_error;
using maestro::core::logging::LogLevel;
using maestro::testing::TempWorkspace;
using nlohmann::json;

TEST(OrchestratorConfigTest, EmptyObjectKeepsDefaults) {
    auto parsed = parse_config(json::object());
    ASSERT_FALSE(is_error(parsed));

    const auto& config = get_value(parsed);
    EXPECT_EQ(config.step_timeout_ms, 0u);
    EXPECT_EQ(config.workflow_timeout_ms, 0u);
    EXPECT_EQ(config.max_parallel_steps, 0u);
    EXPECT_EQ(config.retained_runs, 100u);
    EXPECT_TRUE(config.publish_step_events);
    EXPECT_EQ(config.log_level, LogLevel::INFO);
}

TEST(OrchestratorConfigTest, ReadsEveryKnownKey) {
    const json document = {{"step_timeout_ms", 250},
                           {"workflow_timeout_ms", 5000},
                           {"max_parallel_steps", 4},
                           {"retained_runs", 0},
                           {"publish_step_events", false},
                           {"log_level", "debug"},
                           {"unrelated", "ignored"}};
    auto parsed = parse_config(document);
    ASSERT_FALSE(is_error(parsed));

    const auto& config = get_value(parsed);
    EXPECT_EQ(config.step_timeout_ms, 250u);
    EXPECT_EQ(config.workflow_timeout_ms, 5000u);
    EXPECT_EQ(config.max_parallel_steps, 4u);
    EXPECT_EQ(config.retained_runs, 0u);
    EXPECT_FALSE(config.publish_step_events);
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
}

TEST(OrchestratorConfigTest, RejectsWrongTypes) {
    auto negative = parse_config(json{{"step_timeout_ms", -5}});
    ASSERT_TRUE(is_error(negative));
    EXPECT_EQ(get_error(negative).category, ErrorCategory::Configuration);
    EXPECT_EQ(get_error(negative).code, "config_parse_failed");

    auto text_flag = parse_config(json{{"publish_step_events", "yes"}});
    ASSERT_TRUE(is_error(text_flag));
    EXPECT_EQ(get_error(text_flag).code, "config_parse_failed");

    auto level = parse_config(json{{"log_level", "chatty"}});
    ASSERT_TRUE(is_error(level));
    EXPECT_EQ(get_error(level).code, "config_parse_failed");
    EXPECT_FALSE(get_error(level).hint.empty());
}

TEST(OrchestratorConfigTest, RejectsNonObjectDocument) {
    auto parsed = parse_config(json::array({1, 2}));
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "config_parse_failed");
}

TEST(OrchestratorConfigTest, LoadsFromFile) {
    TempWorkspace workspace;
    const auto path = workspace.root() / "config.json";
    {
        std::ofstream out(path);
        out << R"({"max_parallel_steps": 2, "log_level": "warn"})";
    }

    auto loaded = load_config(path);
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).max_parallel_steps, 2u);
    EXPECT_EQ(get_value(loaded).log_level, LogLevel::WARN);
}

TEST(OrchestratorConfigTest, LoadReportsMissingAndMalformedFiles) {
    TempWorkspace workspace;

    auto missing = load_config(workspace.root() / "absent.json");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "config_open_failed");

    const auto broken = workspace.root() / "broken.json";
    {
        std::ofstream out(broken);
        out << "{ not json";
    }
    auto malformed = load_config(broken);
    ASSERT_TRUE(is_error(malformed));
    EXPECT_EQ(get_error(malformed).code, "config_parse_failed");
}

}  // namespace
