#include "runtime/condition.hpp"

#include <algorithm>
#include <cctype>

namespace maestro::runtime {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;

namespace {

std::string trim(const std::string& value) {
    const auto first = std::find_if_not(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
    const auto last = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) {
                          return std::isspace(c) != 0;
                      }).base();
    if (first >= last) {
        return "";
    }
    return std::string(first, last);
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

OrchestrationError invalid(const std::string& text, const std::string& why) {
    return OrchestrationError{ErrorCategory::Configuration,
                              "Invalid condition '" + text + "': " + why,
                              "invalid_condition",
                              "Expected the form <step>.Success == <true|false>."};
}

}  // namespace

core::errors::Result<Condition> parse_condition(const std::string& text) {
    const auto op = text.find("==");
    if (op == std::string::npos) {
        return invalid(text, "missing '=='");
    }
    if (text.find("==", op + 2) != std::string::npos) {
        return invalid(text, "more than one '=='");
    }

    const std::string left = trim(text.substr(0, op));
    const std::string right = lowercase(trim(text.substr(op + 2)));

    const auto dot = left.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == left.size()) {
        return invalid(text, "left side must be <step>.<field>");
    }

    Condition condition;
    condition.dependency = trim(left.substr(0, dot));
    const std::string field = trim(left.substr(dot + 1));
    if (lowercase(field) != "success") {
        return invalid(text, "unsupported field '" + field + "'");
    }
    condition.field = ConditionField::Success;

    if (right == "true") {
        condition.expected = true;
    } else if (right == "false") {
        condition.expected = false;
    } else {
        return invalid(text, "right side must be true or false");
    }
    return condition;
}

ConditionOutcome evaluate(const Condition& condition,
                          const std::map<std::string, protocol::ActionResult>& context) {
    const auto it = context.find(condition.dependency);
    if (it == context.end()) {
        return ConditionOutcome::DependencyMissing;
    }

    switch (condition.field) {
        case ConditionField::Success:
            return it->second.success == condition.expected ? ConditionOutcome::Met
                                                            : ConditionOutcome::NotMet;
    }
    return ConditionOutcome::NotMet;
}

std::optional<std::string> condition_text(const protocol::WorkflowStep& step) {
    if (step.condition.has_value()) {
        return step.condition;
    }
    const auto it = step.parameters.find("condition");
    if (it != step.parameters.end() && it->second.is_string()) {
        return it->second.get<std::string>();
    }
    return std::nullopt;
}

}  // namespace maestro::runtime
