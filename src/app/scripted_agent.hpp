#pragma once

#include <set>
#include <string>
#include "app/workflow_loader.hpp"
#include "protocol/agent_contract.hpp"

namespace maestro::app {

// Deterministic agent built from a workflow file entry. It acts on the step
// input unchanged and fails every step named in `fail_steps`.
class ScriptedAgent : public protocol::Agent {
public:
    explicit ScriptedAgent(AgentProfile profile);

    std::string id() const override { return profile_.id; }
    std::string name() const override { return profile_.name; }
    protocol::AgentType type() const override { return profile_.type; }
    protocol::AgentCapabilities capabilities() const override { return profile_.capabilities; }

    core::errors::Result<protocol::Action> decide_action(
        const protocol::EnvironmentState& state) override;
    core::errors::Result<protocol::ActionResult> execute(
        const protocol::Action& action) override;

private:
    AgentProfile profile_;
};

}  // namespace maestro::app
