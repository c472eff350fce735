#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/run_id.hpp"
#include "core/errors/orchestration_errors.hpp"
#include "events/event_bus.hpp"
#include "protocol/agent_contract.hpp"

namespace maestro::testing {

// Agent whose behaviour is set per test. By default it echoes the environment
// as its action parameters and succeeds.
class FakeAgent : public protocol::Agent {
public:
    using DecideFn = std::function<core::errors::Result<protocol::Action>(
        const protocol::EnvironmentState&)>;
    using ExecuteFn =
        std::function<core::errors::Result<protocol::ActionResult>(const protocol::Action&)>;

    FakeAgent(std::string id, protocol::AgentType type,
              protocol::AgentCapabilities capabilities = {})
        : id_(std::move(id)), type_(type), capabilities_(std::move(capabilities)) {}

    std::string id() const override { return id_; }
    std::string name() const override { return "agent-" + id_; }
    protocol::AgentType type() const override { return type_; }
    protocol::AgentCapabilities capabilities() const override { return capabilities_; }

    core::errors::Result<protocol::Action> decide_action(
        const protocol::EnvironmentState& state) override {
        ++decide_calls_;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            seen_states_.push_back(state);
        }
        if (on_decide) {
            return on_decide(state);
        }
        protocol::Action action;
        action.action_type = "echo";
        for (const auto& [key, value] : state.properties) {
            action.parameters[key] = value;
        }
        return action;
    }

    core::errors::Result<protocol::ActionResult> execute(
        const protocol::Action& action) override {
        ++execute_calls_;
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (on_execute) {
            return on_execute(action);
        }
        return protocol::ActionResult::succeeded(id_ + " done", action.parameters);
    }

    int decide_calls() const { return decide_calls_.load(); }
    int execute_calls() const { return execute_calls_.load(); }

    std::vector<protocol::EnvironmentState> seen_states() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return seen_states_;
    }

    DecideFn on_decide;
    ExecuteFn on_execute;
    std::chrono::milliseconds delay{0};

private:
    std::string id_;
    protocol::AgentType type_;
    protocol::AgentCapabilities capabilities_;
    std::atomic<int> decide_calls_{0};
    std::atomic<int> execute_calls_{0};
    mutable std::mutex mutex_;
    std::vector<protocol::EnvironmentState> seen_states_;
};

inline std::shared_ptr<FakeAgent> make_agent(const std::string& id, protocol::AgentType type,
                                             protocol::AgentCapabilities capabilities = {}) {
    return std::make_shared<FakeAgent>(id, type, std::move(capabilities));
}

// Records every publication; optionally fails them all, or throws a
// non-standard exception out of publish as a misbehaving bus would.
class RecordingEventBus : public events::EventBus {
public:
    struct Published {
        std::string topic;
        nlohmann::json payload;
    };

    core::errors::Status publish(const std::string& topic,
                                 const nlohmann::json& payload) override {
        std::lock_guard<std::mutex> lock(mutex_);
        published_.push_back(Published{topic, payload});
        if (throw_on_publish) {
            throw 42;
        }
        if (fail_publishes) {
            return core::errors::OrchestrationError{core::errors::ErrorCategory::Internal,
                                                    "bus unavailable", "publish_failed"};
        }
        return core::errors::ok();
    }

    std::vector<Published> on_topic(const std::string& topic) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Published> matching;
        for (const auto& entry : published_) {
            if (entry.topic == topic) {
                matching.push_back(entry);
            }
        }
        return matching;
    }

    bool fail_publishes = false;
    bool throw_on_publish = false;

private:
    mutable std::mutex mutex_;
    std::vector<Published> published_;
};

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_maestro_" + core::config::generate_run_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

}  // namespace maestro::testing
