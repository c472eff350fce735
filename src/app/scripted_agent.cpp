#include "app/scripted_agent.hpp"

#include <utility>

namespace maestro::app {

namespace {

constexpr const char* kDefaultActionType = "respond";

}  // namespace

ScriptedAgent::ScriptedAgent(AgentProfile profile) : profile_(std::move(profile)) {}

core::errors::Result<protocol::Action> ScriptedAgent::decide_action(
    const protocol::EnvironmentState& state) {
    protocol::Action action;
    action.action_type = profile_.capabilities.supported_action_types.empty()
                             ? kDefaultActionType
                             : *profile_.capabilities.supported_action_types.begin();
    for (const auto& [key, value] : state.properties) {
        action.parameters[key] = value;
    }
    return action;
}

core::errors::Result<protocol::ActionResult> ScriptedAgent::execute(
    const protocol::Action& action) {
    std::string step;
    if (const auto it = action.parameters.find("step");
        it != action.parameters.end() && it->is_string()) {
        step = it->get<std::string>();
    }
    if (profile_.fail_steps.count(step) > 0) {
        return protocol::ActionResult::failed(profile_.name + " could not complete " + step);
    }
    return protocol::ActionResult::succeeded(profile_.name + " completed " + step,
                                             action.parameters);
}

}  // namespace maestro::app
