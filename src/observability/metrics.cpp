#include "observability/metrics.hpp"

#include <utility>

namespace maestro::observability {

void InMemoryMetrics::increment(const std::string& name, const double delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[name] += delta;
}

void InMemoryMetrics::record_timing(const std::string& name,
                                    const std::int64_t elapsed_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    timings_[name].push_back(elapsed_ms);
}

double InMemoryMetrics::counter(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(name);
    return it == counters_.end() ? 0.0 : it->second;
}

std::vector<std::int64_t> InMemoryMetrics::timings(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = timings_.find(name);
    if (it == timings_.end()) {
        return {};
    }
    return it->second;
}

nlohmann::json InMemoryMetrics::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json payload;
    payload["counters"] = counters_;
    nlohmann::json timings = nlohmann::json::object();
    for (const auto& [name, samples] : timings_) {
        std::int64_t total = 0;
        for (const auto sample : samples) {
            total += sample;
        }
        timings[name] = {{"count", samples.size()},
                         {"total_ms", total}};
    }
    payload["timings"] = timings;
    return payload;
}

ScopedTimer::ScopedTimer(MetricsSink* sink, std::string name)
    : sink_(sink), name_(std::move(name)), started_(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
    if (sink_ != nullptr) {
        sink_->record_timing(name_, elapsed_ms());
    }
}

std::int64_t ScopedTimer::elapsed_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - started_)
        .count();
}

}  // namespace maestro::observability
