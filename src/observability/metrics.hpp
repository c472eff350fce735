#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace maestro::observability {

class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    virtual void increment(const std::string& name, double delta = 1.0) = 0;
    virtual void record_timing(const std::string& name, std::int64_t elapsed_ms) = 0;
};

class InMemoryMetrics : public MetricsSink {
public:
    void increment(const std::string& name, double delta = 1.0) override;
    void record_timing(const std::string& name, std::int64_t elapsed_ms) override;

    double counter(const std::string& name) const;
    std::vector<std::int64_t> timings(const std::string& name) const;
    nlohmann::json snapshot() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, double> counters_;
    std::map<std::string, std::vector<std::int64_t>> timings_;
};

// Nil-safe helpers: a null sink turns every hook into a no-op.
inline void increment(MetricsSink* sink, const std::string& name, double delta = 1.0) {
    if (sink != nullptr) {
        sink->increment(name, delta);
    }
}

// Records the lifetime of the timer under `name` when it goes out of scope.
class ScopedTimer {
public:
    ScopedTimer(MetricsSink* sink, std::string name);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    std::int64_t elapsed_ms() const;

private:
    MetricsSink* sink_;
    std::string name_;
    std::chrono::steady_clock::time_point started_;
};

}  // namespace maestro::observability
