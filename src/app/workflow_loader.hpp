#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/orchestration_errors.hpp"
#include "protocol/agent_contract.hpp"
#include "protocol/workflow_contract.hpp"

namespace maestro::app {

// One entry of the `agents` list of a workflow file.
struct AgentProfile {
    std::string id;
    std::string name;
    protocol::AgentType type = protocol::AgentType::Reactive;
    protocol::AgentCapabilities capabilities;
    std::set<std::string> fail_steps;
};

struct WorkflowFile {
    protocol::WorkflowDefinition workflow;
    std::vector<AgentProfile> agents;
};

// Every step gets a "step" parameter holding its own name unless the file sets one.
core::errors::Result<WorkflowFile> parse_workflow_document(const nlohmann::json& document);

core::errors::Result<WorkflowFile> load_workflow_file(const std::filesystem::path& path);

}  // namespace maestro::app
