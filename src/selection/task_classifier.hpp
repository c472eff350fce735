#pragma once

#include <string>
#include <vector>

namespace maestro::selection {

struct TaskProfile {
    std::vector<std::string> required_action_types;
    std::string relevant_skill;
};

// Maps free-form task text to the action types and skill it calls for.
class TaskClassifier {
public:
    virtual ~TaskClassifier() = default;

    virtual TaskProfile classify(const std::string& task) const = 0;
};

struct KeywordRule {
    std::string keyword;  // matched case-insensitively as a substring
    std::string action_type;
    std::string skill;
};

// Every matching rule contributes its action type; the first matching rule in
// declaration order names the relevant skill.
class KeywordTaskClassifier : public TaskClassifier {
public:
    KeywordTaskClassifier();
    KeywordTaskClassifier(std::vector<KeywordRule> rules, std::string fallback_skill);

    TaskProfile classify(const std::string& task) const override;

private:
    std::vector<KeywordRule> rules_;
    std::string fallback_skill_;
};

}  // namespace maestro::selection
