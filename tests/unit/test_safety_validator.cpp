#include <string>
#include <gtest/gtest.h>
#include "policy/safety_validator.hpp"

namespace {

using maestro::core::errors::ErrorCategory;
using maestro::core::errors::get_error;
using maestro::core::errors::is_error;
using maestro::policy::KeywordSafetyValidator;
using maestro::policy::TaskPolicy;

TEST(SafetyValidatorTest, AllowsOrdinaryTask) {
    KeywordSafetyValidator validator;
    EXPECT_FALSE(is_error(validator.validate_task("Get weather forecast for Boston")));
}

TEST(SafetyValidatorTest, RejectsEmptyTask) {
    KeywordSafetyValidator validator;
    auto verdict = validator.validate_task("");
    ASSERT_TRUE(is_error(verdict));
    EXPECT_EQ(get_error(verdict).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(verdict).code, "empty_task");
}

TEST(SafetyValidatorTest, RejectsBlockedOperationIgnoringCase) {
    KeywordSafetyValidator validator;
    auto verdict = validator.validate_task("Please DROP TABLE customers");
    ASSERT_TRUE(is_error(verdict));
    EXPECT_EQ(get_error(verdict).category, ErrorCategory::Policy);
    EXPECT_EQ(get_error(verdict).code, "task_rejected");
    EXPECT_EQ(get_error(verdict).message, "Task contains blocked operation: drop table");
}

TEST(SafetyValidatorTest, UsesCustomPolicy) {
    TaskPolicy policy;
    policy.blocked_substrings = {"Launch"};
    KeywordSafetyValidator validator(policy);

    EXPECT_FALSE(is_error(validator.validate_task("rm -rf is allowed here")));
    auto verdict = validator.validate_task("launch the rocket");
    ASSERT_TRUE(is_error(verdict));
    EXPECT_EQ(get_error(verdict).code, "task_rejected");
}

}  // namespace
