#include "registry/agent_registry.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"

namespace maestro::registry {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;

core::errors::Result<AgentIdentity> AgentRegistry::read_identity(const AgentPtr& agent) {
    if (!agent) {
        return OrchestrationError{ErrorCategory::Input, "Agent cannot be null.",
                                  "invalid_agent"};
    }
    return core::errors::capture<AgentIdentity>(
        [&agent]() { return AgentIdentity{agent->id(), agent->name(), agent->type()}; },
        ErrorCategory::Input, "Agent identity", "invalid_agent");
}

core::errors::Result<Registration> AgentRegistry::register_agent(AgentPtr agent) {
    auto identity = read_identity(agent);
    if (core::errors::is_error(identity)) {
        LOG_WARN("AgentRegistry: rejected agent: " +
                 core::errors::get_error(identity).message);
        return core::errors::get_error(identity);
    }

    Registration registration{core::errors::get_value(identity), false};
    const std::string& agent_id = registration.identity.id;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&agent_id](const Entry& existing) {
                               return existing.identity.id == agent_id;
                           });
    if (it != entries_.end()) {
        *it = Entry{registration.identity, std::move(agent)};
        registration.replaced = true;
        LOG_INFO("AgentRegistry: replaced agent " + agent_id);
        return registration;
    }

    LOG_INFO("AgentRegistry: registered agent " + registration.identity.name + " (" +
             agent_id + ")");
    entries_.push_back(Entry{registration.identity, std::move(agent)});
    return registration;
}

bool AgentRegistry::unregister_agent(const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&agent_id](const Entry& existing) {
                               return existing.identity.id == agent_id;
                           });
    if (it == entries_.end()) {
        LOG_WARN("AgentRegistry: attempted to unregister unknown agent " + agent_id);
        return false;
    }

    entries_.erase(it);
    LOG_INFO("AgentRegistry: unregistered agent " + agent_id);
    return true;
}

AgentPtr AgentRegistry::find(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
        if (entry.identity.id == agent_id) {
            return entry.agent;
        }
    }
    return nullptr;
}

std::vector<AgentPtr> AgentRegistry::agents_of_type(
    const protocol::AgentType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AgentPtr> matches;
    for (const auto& entry : entries_) {
        if (entry.identity.type == type) {
            matches.push_back(entry.agent);
        }
    }
    return matches;
}

std::vector<AgentPtr> AgentRegistry::all_agents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AgentPtr> agents;
    agents.reserve(entries_.size());
    for (const auto& entry : entries_) {
        agents.push_back(entry.agent);
    }
    return agents;
}

std::size_t AgentRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace maestro::registry
