#pragma once
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include "protocol/agent_contract.hpp"

namespace maestro::protocol {

    // Topics the orchestrator publishes on
    namespace topics {
        inline constexpr const char* kAgentRegistered = "agent.registered";
        inline constexpr const char* kAgentUnregistered = "agent.unregistered";
        inline constexpr const char* kTaskAssigned = "task.assigned";
        inline constexpr const char* kStepCompleted = "workflow.step.completed";
        inline constexpr const char* kWorkflowCompleted = "workflow.completed";
    }  // namespace topics

    struct AgentRegisteredEvent { std::string agent_id; std::string agent_name; };
    struct AgentUnregisteredEvent { std::string agent_id; };
    struct TaskAssignedEvent { std::string task; std::string agent_id; std::string agent_name; };

    struct StepCompletedEvent {
        std::string run_id;
        std::string step_name;
        std::string agent_id;
        Action action;
        ActionResult result;
    };

    struct WorkflowCompletedEvent {
        std::string run_id;
        std::string workflow_name;
        bool success;
        std::size_t error_count;
    };

    inline nlohmann::json to_json(const AgentRegisteredEvent& event) {
        return {{"agent_id", event.agent_id}, {"agent_name", event.agent_name}};
    }

    inline nlohmann::json to_json(const AgentUnregisteredEvent& event) {
        return {{"agent_id", event.agent_id}};
    }

    inline nlohmann::json to_json(const TaskAssignedEvent& event) {
        return {{"task", event.task},
                {"agent_id", event.agent_id},
                {"agent_name", event.agent_name}};
    }

    inline nlohmann::json to_json(const StepCompletedEvent& event) {
        nlohmann::json payload;
        payload["run_id"] = event.run_id;
        payload["step_name"] = event.step_name;
        payload["agent_id"] = event.agent_id;
        payload["action"] = to_json(event.action);
        payload["result"] = to_json(event.result);
        return payload;
    }

    inline nlohmann::json to_json(const WorkflowCompletedEvent& event) {
        return {{"run_id", event.run_id},
                {"workflow_name", event.workflow_name},
                {"success", event.success},
                {"error_count", event.error_count}};
    }

} // namespace maestro::protocol
