#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/orchestration_errors.hpp"

namespace maestro::events {

// Best-effort publication channel. Callers log a failed publish and carry on;
// a publish error never changes the outcome of the work that triggered it.
class EventBus {
public:
    virtual ~EventBus() = default;

    virtual core::errors::Status publish(const std::string& topic,
                                         const nlohmann::json& payload) = 0;
};

// Synchronous in-process bus. Handlers run on the publishing thread, outside the
// bus lock, so a handler may publish again or subscribe.
class InMemoryEventBus : public EventBus {
public:
    using Handler = std::function<void(const std::string& topic,
                                       const nlohmann::json& payload)>;

    core::errors::Status publish(const std::string& topic,
                                 const nlohmann::json& payload) override;

    std::uint64_t subscribe(const std::string& topic, Handler handler);
    bool unsubscribe(std::uint64_t subscription_id);

    std::size_t published_count(const std::string& topic) const;

private:
    struct Subscription {
        std::uint64_t id;
        std::string topic;
        Handler handler;
    };

    mutable std::mutex mutex_;
    std::uint64_t next_id_ = 1;
    std::vector<Subscription> subscriptions_;
    std::map<std::string, std::size_t> published_;
};

}  // namespace maestro::events
