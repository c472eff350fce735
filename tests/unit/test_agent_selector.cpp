#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "selection/agent_selector.hpp"
#include "test_support.hpp"

namespace {

using maestro::core::errors::ErrorCategory;
using maestro::core::errors::get_error;
using maestro::core::errors::get_value;
using maestro::core::errors::is_error;
using maestro::protocol::AgentCapabilities;
using maestro::protocol::AgentType;
using maestro::protocol::WorkflowStep;
using maestro::registry::AgentPtr;
using maestro::selection::AgentRequirements;
using maestro::selection::AgentSelector;
using maestro::selection::TaskProfile;
using maestro::testing::make_agent;

AgentCapabilities capabilities(std::set<std::string> actions,
                               std::map<std::string, double> skills, double load,
                               double performance) {
    AgentCapabilities caps;
    caps.supported_action_types = std::move(actions);
    caps.skill_levels = std::move(skills);
    caps.load_factor = load;
    caps.historical_performance = performance;
    return caps;
}

TEST(AgentSelectorTest, ScoreAppliesWeights) {
    TaskProfile profile;
    profile.required_action_types = {"WeatherQuery", "Planning"};
    profile.relevant_skill = "weather_analysis";

    const auto caps = capabilities({"WeatherQuery"}, {{"weather_analysis", 0.5}}, 0.25, 0.5);
    // 10 * 1 + 5 * 0.5 - 2 * 0.25 + 3 * 0.5
    EXPECT_DOUBLE_EQ(AgentSelector::score(caps, profile), 13.5);
}

TEST(AgentSelectorTest, MissingSkillContributesNothing) {
    TaskProfile profile;
    profile.relevant_skill = "planning";
    const auto caps = capabilities({}, {{"weather_analysis", 1.0}}, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(AgentSelector::score(caps, profile), 0.0);
}

TEST(AgentSelectorTest, EmptyCandidatesFailWithNoCandidate) {
    AgentSelector selector;
    auto selected = selector.select_best_agent("anything", {});
    ASSERT_TRUE(is_error(selected));
    EXPECT_EQ(get_error(selected).category, ErrorCategory::Selection);
    EXPECT_EQ(get_error(selected).code, "no_candidate");
}

TEST(AgentSelectorTest, PicksHighestScore) {
    AgentSelector selector;
    std::vector<AgentPtr> candidates = {
        make_agent("planner", AgentType::Reactive,
                   capabilities({}, {{"planning", 0.9}}, 0.3, 0.8)),
        make_agent("weather", AgentType::Reactive,
                   capabilities({}, {{"weather_analysis", 0.9}}, 0.1, 0.8)),
    };

    auto selected = selector.select_best_agent("What's the weather?", candidates);
    ASSERT_FALSE(is_error(selected));
    EXPECT_EQ(get_value(selected)->id(), "weather");
}

TEST(AgentSelectorTest, TiesAlwaysResolveToFirstCandidate) {
    AgentSelector selector;
    const auto caps = capabilities({"Planning"}, {{"planning", 0.5}}, 0.2, 0.5);
    std::vector<AgentPtr> candidates = {make_agent("first", AgentType::Reactive, caps),
                                        make_agent("second", AgentType::Reactive, caps)};

    for (int i = 0; i < 20; ++i) {
        auto selected = selector.select_best_agent("plan the sprint", candidates);
        ASSERT_FALSE(is_error(selected));
        EXPECT_EQ(get_value(selected)->id(), "first");
    }
}

TEST(AgentSelectorTest, NegativeScoresStillSelectSomeone) {
    AgentSelector selector;
    std::vector<AgentPtr> candidates = {
        make_agent("busy", AgentType::Reactive, capabilities({}, {}, 0.9, 0.0)),
        make_agent("busier", AgentType::Reactive, capabilities({}, {}, 1.0, 0.0)),
    };
    auto selected = selector.select_best_agent("idle chatter", candidates);
    ASSERT_FALSE(is_error(selected));
    EXPECT_EQ(get_value(selected)->id(), "busy");
}

TEST(AgentSelectorTest, FilterAppliesEveryRequirement) {
    std::vector<AgentPtr> candidates = {
        make_agent("match", AgentType::Deliberative,
                   capabilities({"Planning", "Search"}, {{"planning", 0.8}, {"search", 0.6}},
                                0.2, 0.0)),
        make_agent("wrong-type", AgentType::Reactive,
                   capabilities({"Planning", "Search"}, {{"planning", 0.9}}, 0.1, 0.0)),
        make_agent("missing-action", AgentType::Deliberative,
                   capabilities({"Planning"}, {{"planning", 0.9}}, 0.1, 0.0)),
        make_agent("unskilled", AgentType::Deliberative,
                   capabilities({"Planning", "Search"}, {{"planning", 0.2}}, 0.1, 0.0)),
        make_agent("overloaded", AgentType::Deliberative,
                   capabilities({"Planning", "Search"}, {{"planning", 0.9}}, 0.95, 0.0)),
    };

    AgentRequirements requirements;
    requirements.agent_type = AgentType::Deliberative;
    requirements.required_action_types = {"Planning", "Search"};
    requirements.minimum_skill_level = 0.5;
    requirements.max_load_factor = 0.5;

    const auto filtered = AgentSelector::filter(candidates, requirements);
    ASSERT_EQ(filtered.size(), 1u);
    EXPECT_EQ(filtered[0]->id(), "match");
}

TEST(AgentSelectorTest, DescribeStepUsesNameAndStringParameters) {
    WorkflowStep step;
    step.name = "step1";
    step.parameters["input"] = "What's the weather?";
    step.parameters["retries"] = 3;
    step.parameters["condition"] = "step0.Success == true";

    EXPECT_EQ(AgentSelector::describe_step(step), "step1 What's the weather?");
}

}  // namespace
