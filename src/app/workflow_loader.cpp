#include "app/workflow_loader.hpp"

#include <fstream>
#include <utility>

namespace maestro::app {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;
using nlohmann::json;

namespace {

OrchestrationError parse_error(const std::string& message) {
    return OrchestrationError{ErrorCategory::Input, message, "workflow_parse_failed"};
}

core::errors::Result<std::vector<std::string>> read_string_list(const json& object,
                                                                const char* key,
                                                                const std::string& owner) {
    std::vector<std::string> values;
    const auto it = object.find(key);
    if (it == object.end()) {
        return values;
    }
    if (!it->is_array()) {
        return parse_error("'" + std::string(key) + "' of " + owner + " must be an array");
    }
    for (const auto& item : *it) {
        if (!item.is_string()) {
            return parse_error("'" + std::string(key) + "' of " + owner +
                               " must only contain strings");
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

core::errors::Result<double> read_number(const json& object, const char* key,
                                         const std::string& owner) {
    const auto it = object.find(key);
    if (it == object.end()) {
        return 0.0;
    }
    if (!it->is_number()) {
        return parse_error("'" + std::string(key) + "' of " + owner + " must be a number");
    }
    return it->get<double>();
}

core::errors::Result<protocol::AgentType> read_agent_type(const json& object,
                                                          const char* key,
                                                          const std::string& owner) {
    const auto it = object.find(key);
    if (it == object.end()) {
        return protocol::AgentType::Reactive;
    }
    if (!it->is_string()) {
        return parse_error("'" + std::string(key) + "' of " + owner + " must be a string");
    }
    const auto type = protocol::parse_agent_type(it->get<std::string>());
    if (!type.has_value()) {
        return OrchestrationError{ErrorCategory::Input,
                                  "Unknown agent type '" + it->get<std::string>() +
                                      "' in " + owner,
                                  "workflow_parse_failed",
                                  "Use one of reactive, deliberative, hybrid, bdi, "
                                  "utility_based, learning."};
    }
    return type.value();
}

core::errors::Result<protocol::WorkflowStep> parse_step(const json& node,
                                                        const std::size_t index) {
    const std::string owner = "step #" + std::to_string(index);
    if (!node.is_object()) {
        return parse_error(owner + " must be an object");
    }

    protocol::WorkflowStep step;
    const auto name = node.find("name");
    if (name == node.end() || !name->is_string()) {
        return parse_error(owner + " needs a string 'name'");
    }
    step.name = name->get<std::string>();

    auto type = read_agent_type(node, "required_agent_type", owner);
    if (core::errors::is_error(type)) {
        return core::errors::get_error(type);
    }
    step.required_agent_type = core::errors::get_value(type);

    if (const auto params = node.find("parameters"); params != node.end()) {
        if (!params->is_object()) {
            return parse_error("'parameters' of " + owner + " must be an object");
        }
        for (const auto& [key, value] : params->items()) {
            step.parameters[key] = value;
        }
    }
    if (step.parameters.find("step") == step.parameters.end()) {
        step.parameters["step"] = step.name;
    }

    auto dependencies = read_string_list(node, "dependencies", owner);
    if (core::errors::is_error(dependencies)) {
        return core::errors::get_error(dependencies);
    }
    step.dependencies = core::errors::get_value(dependencies);

    if (const auto condition = node.find("condition"); condition != node.end()) {
        if (!condition->is_string()) {
            return parse_error("'condition' of " + owner + " must be a string");
        }
        step.condition = condition->get<std::string>();
    }
    return step;
}

core::errors::Result<AgentProfile> parse_agent(const json& node, const std::size_t index) {
    std::string owner = "agent #" + std::to_string(index);
    if (!node.is_object()) {
        return parse_error(owner + " must be an object");
    }

    AgentProfile profile;
    const auto id = node.find("id");
    if (id == node.end() || !id->is_string() || id->get<std::string>().empty()) {
        return parse_error(owner + " needs a non-empty string 'id'");
    }
    profile.id = id->get<std::string>();
    owner = "agent " + profile.id;
    profile.name = profile.id;
    if (const auto name = node.find("name"); name != node.end()) {
        if (!name->is_string()) {
            return parse_error("'name' of " + owner + " must be a string");
        }
        profile.name = name->get<std::string>();
    }

    auto type = read_agent_type(node, "type", owner);
    if (core::errors::is_error(type)) {
        return core::errors::get_error(type);
    }
    profile.type = core::errors::get_value(type);

    auto actions = read_string_list(node, "supported_action_types", owner);
    if (core::errors::is_error(actions)) {
        return core::errors::get_error(actions);
    }
    const auto& action_list = core::errors::get_value(actions);
    profile.capabilities.supported_action_types.insert(action_list.begin(), action_list.end());

    if (const auto skills = node.find("skill_levels"); skills != node.end()) {
        if (!skills->is_object()) {
            return parse_error("'skill_levels' of " + owner + " must be an object");
        }
        for (const auto& [skill, level] : skills->items()) {
            if (!level.is_number()) {
                return parse_error("skill '" + skill + "' of " + owner + " must be a number");
            }
            profile.capabilities.skill_levels[skill] = level.get<double>();
        }
    }

    auto load = read_number(node, "load_factor", owner);
    if (core::errors::is_error(load)) {
        return core::errors::get_error(load);
    }
    profile.capabilities.load_factor = core::errors::get_value(load);

    auto performance = read_number(node, "historical_performance", owner);
    if (core::errors::is_error(performance)) {
        return core::errors::get_error(performance);
    }
    profile.capabilities.historical_performance = core::errors::get_value(performance);

    auto fail_steps = read_string_list(node, "fail_steps", owner);
    if (core::errors::is_error(fail_steps)) {
        return core::errors::get_error(fail_steps);
    }
    const auto& fail_list = core::errors::get_value(fail_steps);
    profile.fail_steps.insert(fail_list.begin(), fail_list.end());
    return profile;
}

}  // namespace

core::errors::Result<WorkflowFile> parse_workflow_document(const json& document) {
    if (!document.is_object()) {
        return parse_error("Workflow file must be a JSON object");
    }
    const auto workflow = document.find("workflow");
    if (workflow == document.end() || !workflow->is_object()) {
        return parse_error("Workflow file needs a 'workflow' object");
    }

    WorkflowFile file;
    const auto name = workflow->find("name");
    if (name == workflow->end() || !name->is_string()) {
        return parse_error("Workflow needs a string 'name'");
    }
    file.workflow.name = name->get<std::string>();

    const auto type = workflow->find("type");
    if (type == workflow->end() || !type->is_string()) {
        return parse_error("Workflow needs a string 'type'");
    }
    const auto parsed_type = protocol::parse_workflow_type(type->get<std::string>());
    if (!parsed_type.has_value()) {
        return OrchestrationError{ErrorCategory::Configuration,
                                  "Unknown workflow type: " + type->get<std::string>(),
                                  "unknown_workflow_type",
                                  "Use one of sequential, parallel, conditional, "
                                  "hierarchical."};
    }
    file.workflow.type = parsed_type.value();

    const auto steps = workflow->find("steps");
    if (steps == workflow->end() || !steps->is_array()) {
        return parse_error("Workflow needs a 'steps' array");
    }
    for (std::size_t i = 0; i < steps->size(); ++i) {
        auto step = parse_step((*steps)[i], i);
        if (core::errors::is_error(step)) {
            return core::errors::get_error(step);
        }
        file.workflow.steps.push_back(core::errors::get_value(step));
    }

    if (const auto agents = document.find("agents"); agents != document.end()) {
        if (!agents->is_array()) {
            return parse_error("'agents' must be an array");
        }
        for (std::size_t i = 0; i < agents->size(); ++i) {
            auto agent = parse_agent((*agents)[i], i);
            if (core::errors::is_error(agent)) {
                return core::errors::get_error(agent);
            }
            file.agents.push_back(core::errors::get_value(agent));
        }
    }
    return file;
}

core::errors::Result<WorkflowFile> load_workflow_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return OrchestrationError{ErrorCategory::Input,
                                  "Unable to open workflow file: " + path.string(),
                                  "workflow_open_failed"};
    }

    json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return parse_error("Workflow file is not valid JSON: " + path.string());
    }
    return parse_workflow_document(document);
}

}  // namespace maestro::app
