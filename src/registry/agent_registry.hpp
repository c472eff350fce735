#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "core/errors/orchestration_errors.hpp"
#include "protocol/agent_contract.hpp"

namespace maestro::registry {

using AgentPtr = std::shared_ptr<protocol::Agent>;

// Identity accessors of an agent, read once when it registers.
struct AgentIdentity {
    std::string id;
    std::string name;
    protocol::AgentType type = protocol::AgentType::Reactive;
};

struct Registration {
    AgentIdentity identity;
    bool replaced = false;
};

// Mutex-guarded set of registered agents, kept in registration order.
//
// Re-registering an ID replaces the earlier agent in its original position, so
// the order used for tie-breaking is the order in which IDs first appeared.
// Every read returns a copy taken under the lock. Lookups by ID or type use the
// identity cached at registration; no agent code runs while the lock is held.
class AgentRegistry {
public:
    // Fails for a null agent or one whose identity accessors throw.
    core::errors::Result<Registration> register_agent(AgentPtr agent);

    // Returns false (and logs) when the ID was not registered.
    bool unregister_agent(const std::string& agent_id);

    AgentPtr find(const std::string& agent_id) const;
    std::vector<AgentPtr> agents_of_type(protocol::AgentType type) const;
    std::vector<AgentPtr> all_agents() const;

    std::size_t size() const;

    static core::errors::Result<AgentIdentity> read_identity(const AgentPtr& agent);

private:
    struct Entry {
        AgentIdentity identity;
        AgentPtr agent;
    };

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

}  // namespace maestro::registry
