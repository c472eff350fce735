#include "events/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include "core/logging/logger.hpp"

namespace maestro::events {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;

core::errors::Status InMemoryEventBus::publish(const std::string& topic,
                                               const nlohmann::json& payload) {
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++published_[topic];
        for (const auto& subscription : subscriptions_) {
            if (subscription.topic == topic) {
                handlers.push_back(subscription.handler);
            }
        }
    }

    std::string failures;
    auto note_failure = [&failures, &topic](const std::string& what) {
        LOG_WARN("EventBus: handler for " + topic + " threw: " + what);
        if (!failures.empty()) {
            failures += "; ";
        }
        failures += what;
    };
    for (const auto& handler : handlers) {
        try {
            handler(topic, payload);
        } catch (const std::exception& ex) {
            note_failure(ex.what());
        } catch (...) {
            note_failure("non-standard exception");
        }
    }

    if (!failures.empty()) {
        return OrchestrationError{ErrorCategory::Internal,
                                  "Subscriber failed for topic " + topic + ": " + failures,
                                  "publish_failed"};
    }
    return core::errors::ok();
}

std::uint64_t InMemoryEventBus::subscribe(const std::string& topic, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::uint64_t id = next_id_++;
    subscriptions_.push_back(Subscription{id, topic, std::move(handler)});
    return id;
}

bool InMemoryEventBus::unsubscribe(const std::uint64_t subscription_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                                 [subscription_id](const Subscription& subscription) {
                                     return subscription.id == subscription_id;
                                 });
    if (it == subscriptions_.end()) {
        return false;
    }
    subscriptions_.erase(it);
    return true;
}

std::size_t InMemoryEventBus::published_count(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = published_.find(topic);
    return it == published_.end() ? 0 : it->second;
}

}  // namespace maestro::events
