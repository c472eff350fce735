#include "selection/agent_selector.hpp"

#include <algorithm>
#include <optional>
#include <utility>
#include "core/logging/logger.hpp"

namespace maestro::selection {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;

namespace {

struct CandidateView {
    std::string id;
    protocol::AgentType type;
    protocol::AgentCapabilities capabilities;
};

// Reads what scoring and filtering need from an agent. A candidate whose
// accessors throw is left out of the selection.
std::optional<CandidateView> inspect(const registry::AgentPtr& candidate) {
    auto view = core::errors::capture<CandidateView>(
        [&candidate]() {
            return CandidateView{candidate->id(), candidate->type(),
                                 candidate->capabilities()};
        },
        ErrorCategory::Selection, "Candidate agent");
    if (core::errors::is_error(view)) {
        LOG_WARN("AgentSelector: skipping candidate: " +
                 core::errors::get_error(view).message);
        return std::nullopt;
    }
    return core::errors::get_value(view);
}

}  // namespace

AgentSelector::AgentSelector(std::shared_ptr<const TaskClassifier> classifier)
    : classifier_(std::move(classifier)) {
    if (!classifier_) {
        classifier_ = std::make_shared<KeywordTaskClassifier>();
    }
}

double AgentSelector::score(const protocol::AgentCapabilities& capabilities,
                            const TaskProfile& profile) {
    double total = 0.0;

    int supported = 0;
    for (const auto& action_type : profile.required_action_types) {
        if (capabilities.supported_action_types.count(action_type) > 0) {
            ++supported;
        }
    }
    total += 10.0 * supported;

    const auto skill = capabilities.skill_levels.find(profile.relevant_skill);
    if (skill != capabilities.skill_levels.end()) {
        total += 5.0 * skill->second;
    }

    total -= 2.0 * capabilities.load_factor;
    total += 3.0 * capabilities.historical_performance;
    return total;
}

core::errors::Result<registry::AgentPtr> AgentSelector::select_best_agent(
    const std::string& task,
    const std::vector<registry::AgentPtr>& candidates) const {
    if (candidates.empty()) {
        return OrchestrationError{ErrorCategory::Selection,
                                  "No candidate agents for task: " + task,
                                  "no_candidate"};
    }

    const auto classified = core::errors::capture<TaskProfile>(
        [this, &task]() { return classifier_->classify(task); }, ErrorCategory::Selection,
        "Task classifier", "classifier_failed");
    if (core::errors::is_error(classified)) {
        LOG_WARN("AgentSelector: " + core::errors::get_error(classified).message);
        return core::errors::get_error(classified);
    }
    const TaskProfile& profile = core::errors::get_value(classified);

    registry::AgentPtr best;
    double best_score = 0.0;
    for (const auto& candidate : candidates) {
        const auto view = inspect(candidate);
        if (!view.has_value()) {
            continue;
        }
        const double candidate_score = score(view->capabilities, profile);
        LOG_DEBUG("AgentSelector: " + view->id + " scored " +
                  std::to_string(candidate_score) + " for '" + task + "'");
        if (!best || candidate_score > best_score) {
            best = candidate;
            best_score = candidate_score;
        }
    }
    if (!best) {
        return OrchestrationError{ErrorCategory::Selection,
                                  "No usable candidate agents for task: " + task,
                                  "no_candidate"};
    }
    return best;
}

std::vector<registry::AgentPtr> AgentSelector::filter(
    const std::vector<registry::AgentPtr>& candidates,
    const AgentRequirements& requirements) {
    std::vector<registry::AgentPtr> filtered;
    for (const auto& candidate : candidates) {
        const auto view = inspect(candidate);
        if (!view.has_value()) {
            continue;
        }
        if (requirements.agent_type.has_value() &&
            view->type != requirements.agent_type.value()) {
            continue;
        }

        const auto& capabilities = view->capabilities;
        const bool supports_all = std::all_of(
            requirements.required_action_types.begin(),
            requirements.required_action_types.end(),
            [&capabilities](const std::string& action_type) {
                return capabilities.supported_action_types.count(action_type) > 0;
            });
        if (!supports_all) {
            continue;
        }

        if (requirements.minimum_skill_level > 0.0) {
            if (capabilities.skill_levels.empty()) {
                continue;
            }
            double total = 0.0;
            for (const auto& entry : capabilities.skill_levels) {
                total += entry.second;
            }
            const double average =
                total / static_cast<double>(capabilities.skill_levels.size());
            if (average < requirements.minimum_skill_level) {
                continue;
            }
        }

        if (capabilities.load_factor > requirements.max_load_factor) {
            continue;
        }
        filtered.push_back(candidate);
    }
    return filtered;
}

std::string AgentSelector::describe_step(const protocol::WorkflowStep& step) {
    std::string description = step.name;
    for (const auto& [key, value] : step.parameters) {
        if (key == "condition" || !value.is_string()) {
            continue;
        }
        description += " " + value.get<std::string>();
    }
    return description;
}

}  // namespace maestro::selection
