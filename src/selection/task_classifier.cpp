#include "selection/task_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace maestro::selection {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

}  // namespace

KeywordTaskClassifier::KeywordTaskClassifier()
    : KeywordTaskClassifier(
          {
              {"weather", "WeatherQuery", "weather_analysis"},
              {"plan", "Planning", "planning"},
              {"urgent", "ReactiveResponse", "quick_response"},
          },
          "general") {}

KeywordTaskClassifier::KeywordTaskClassifier(std::vector<KeywordRule> rules,
                                             std::string fallback_skill)
    : rules_(std::move(rules)), fallback_skill_(std::move(fallback_skill)) {}

TaskProfile KeywordTaskClassifier::classify(const std::string& task) const {
    TaskProfile profile;
    const std::string lowered = lowercase(task);
    for (const auto& rule : rules_) {
        if (lowered.find(lowercase(rule.keyword)) == std::string::npos) {
            continue;
        }
        profile.required_action_types.push_back(rule.action_type);
        if (profile.relevant_skill.empty()) {
            profile.relevant_skill = rule.skill;
        }
    }
    if (profile.relevant_skill.empty()) {
        profile.relevant_skill = fallback_skill_;
    }
    return profile;
}

}  // namespace maestro::selection
