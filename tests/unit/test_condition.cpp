#include <map>
#include <string>
#include <gtest/gtest.h>
#include "runtime/condition.hpp"

namespace {

using maestro::core::errors::ErrorCategory;
using maestro::core::errors::get_error;
using maestro::core::errors::get_value;
using maestro::core::errors::is_error;
using maestro::protocol::ActionResult;
using maestro::protocol::WorkflowStep;
using maestro::runtime::condition_text;
using maestro::runtime::ConditionOutcome;
using maestro::runtime::evaluate;
using maestro::runtime::parse_condition;

TEST(ConditionTest, ParsesSuccessComparison) {
    auto parsed = parse_condition("fetch.Success == true");
    ASSERT_FALSE(is_error(parsed));
    EXPECT_EQ(get_value(parsed).dependency, "fetch");
    EXPECT_TRUE(get_value(parsed).expected);
}

TEST(ConditionTest, ToleratesSpacingAndCase) {
    auto parsed = parse_condition("  step.one.success==FALSE ");
    ASSERT_FALSE(is_error(parsed));
    EXPECT_EQ(get_value(parsed).dependency, "step.one");
    EXPECT_FALSE(get_value(parsed).expected);
}

TEST(ConditionTest, RejectsMalformedText) {
    for (const std::string text :
         {"fetch.Success", "fetch == true", ".Success == true", "fetch.Message == true",
          "fetch.Success == maybe", "a.Success == true == false"}) {
        auto parsed = parse_condition(text);
        ASSERT_TRUE(is_error(parsed)) << text;
        EXPECT_EQ(get_error(parsed).category, ErrorCategory::Configuration);
        EXPECT_EQ(get_error(parsed).code, "invalid_condition");
    }
}

TEST(ConditionTest, EvaluatesAgainstContext) {
    auto parsed = parse_condition("fetch.Success == true");
    ASSERT_FALSE(is_error(parsed));
    const auto& condition = get_value(parsed);

    std::map<std::string, ActionResult> context;
    EXPECT_EQ(evaluate(condition, context), ConditionOutcome::DependencyMissing);

    context["fetch"] = ActionResult::succeeded("ok");
    EXPECT_EQ(evaluate(condition, context), ConditionOutcome::Met);

    context["fetch"] = ActionResult::failed("boom");
    EXPECT_EQ(evaluate(condition, context), ConditionOutcome::NotMet);
}

TEST(ConditionTest, ConditionFieldTakesPrecedenceOverParameter) {
    WorkflowStep step;
    EXPECT_FALSE(condition_text(step).has_value());

    step.parameters["condition"] = "a.Success == false";
    ASSERT_TRUE(condition_text(step).has_value());
    EXPECT_EQ(condition_text(step).value(), "a.Success == false");

    step.condition = "b.Success == true";
    EXPECT_EQ(condition_text(step).value(), "b.Success == true");
}

}  // namespace
