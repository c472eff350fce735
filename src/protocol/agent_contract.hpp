#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/errors/orchestration_errors.hpp"

namespace maestro::protocol {

// Decision-making style of an agent; workflow steps are matched on this tag.
enum class AgentType {
    Reactive,
    Deliberative,
    Hybrid,
    BDI,
    UtilityBased,
    Learning
};

struct AgentCapabilities {
    std::set<std::string> supported_action_types;
    std::map<std::string, double> skill_levels;  // 0.0 - 1.0
    double load_factor = 0.0;                    // lower is more available
    double historical_performance = 0.0;         // 0.0 - 1.0
};

// Snapshot of the world an agent reasons over when deciding what to do.
struct EnvironmentState {
    std::map<std::string, nlohmann::json> properties;
    std::chrono::system_clock::time_point captured_at =
        std::chrono::system_clock::now();
};

struct Action {
    std::string action_type;
    nlohmann::json parameters = nlohmann::json::object();
    int priority = 0;
    double estimated_cost = 0.0;
};

struct ActionResult {
    bool success = false;
    std::string message;
    nlohmann::json data = nlohmann::json::object();
    std::chrono::milliseconds execution_time{0};

    static ActionResult succeeded(std::string message,
                                  nlohmann::json data = nlohmann::json::object()) {
        ActionResult result;
        result.success = true;
        result.message = std::move(message);
        result.data = std::move(data);
        return result;
    }

    static ActionResult failed(std::string message) {
        ActionResult result;
        result.success = false;
        result.message = std::move(message);
        return result;
    }
};

// An autonomous agent supplied by the caller. The orchestrator never constructs
// or destroys agents; it shares ownership only while the agent is registered.
//
// Implementations must be safe to call from several threads at once: a parallel
// workflow may route concurrent steps to the same agent instance.
class Agent {
public:
    virtual ~Agent() = default;

    virtual std::string id() const = 0;
    virtual std::string name() const = 0;
    virtual AgentType type() const = 0;
    virtual AgentCapabilities capabilities() const = 0;

    virtual core::errors::Result<Action> decide_action(const EnvironmentState& state) = 0;
    virtual core::errors::Result<ActionResult> execute(const Action& action) = 0;
};

inline std::string to_string(const AgentType type) {
    switch (type) {
        case AgentType::Reactive:
            return "reactive";
        case AgentType::Deliberative:
            return "deliberative";
        case AgentType::Hybrid:
            return "hybrid";
        case AgentType::BDI:
            return "bdi";
        case AgentType::UtilityBased:
            return "utility_based";
        case AgentType::Learning:
            return "learning";
        default:
            return "unknown";
    }
}

inline std::optional<AgentType> parse_agent_type(const std::string& text) {
    for (const auto type : {AgentType::Reactive, AgentType::Deliberative,
                            AgentType::Hybrid, AgentType::BDI,
                            AgentType::UtilityBased, AgentType::Learning}) {
        if (to_string(type) == text) {
            return type;
        }
    }
    return std::nullopt;
}

inline nlohmann::json to_json(const Action& action) {
    nlohmann::json payload;
    payload["action_type"] = action.action_type;
    payload["parameters"] = action.parameters;
    payload["priority"] = action.priority;
    payload["estimated_cost"] = action.estimated_cost;
    return payload;
}

inline nlohmann::json to_json(const ActionResult& result) {
    nlohmann::json payload;
    payload["success"] = result.success;
    payload["message"] = result.message;
    payload["data"] = result.data;
    payload["execution_time_ms"] = result.execution_time.count();
    return payload;
}

}  // namespace maestro::protocol
