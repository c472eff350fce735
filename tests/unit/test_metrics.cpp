#include <gtest/gtest.h>
#include "observability/metrics.hpp"

namespace {

using maestro::observability::increment;
using maestro::observability::InMemoryMetrics;
using maestro::observability::ScopedTimer;

TEST(InMemoryMetricsTest, CountersAccumulate) {
    InMemoryMetrics metrics;
    metrics.increment("orchestrator.agents.count");
    metrics.increment("orchestrator.agents.count");
    metrics.increment("orchestrator.agents.count", -1.0);

    EXPECT_DOUBLE_EQ(metrics.counter("orchestrator.agents.count"), 1.0);
    EXPECT_DOUBLE_EQ(metrics.counter("never.touched"), 0.0);
}

TEST(InMemoryMetricsTest, ScopedTimerRecordsOnDestruction) {
    InMemoryMetrics metrics;
    {
        ScopedTimer timer(&metrics, "step.fetch.duration_ms");
        EXPECT_TRUE(metrics.timings("step.fetch.duration_ms").empty());
    }
    const auto samples = metrics.timings("step.fetch.duration_ms");
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_GE(samples[0], 0);
}

TEST(InMemoryMetricsTest, NullSinkIsANoOp) {
    increment(nullptr, "anything");
    ScopedTimer timer(nullptr, "anything.duration_ms");
    EXPECT_GE(timer.elapsed_ms(), 0);
}

TEST(InMemoryMetricsTest, SnapshotSummarisesTimings) {
    InMemoryMetrics metrics;
    metrics.increment("workflow.demo.started");
    metrics.record_timing("workflow.demo.duration_ms", 5);
    metrics.record_timing("workflow.demo.duration_ms", 7);

    const auto snapshot = metrics.snapshot();
    EXPECT_DOUBLE_EQ(snapshot["counters"]["workflow.demo.started"].get<double>(), 1.0);
    EXPECT_EQ(snapshot["timings"]["workflow.demo.duration_ms"]["count"], 2);
    EXPECT_EQ(snapshot["timings"]["workflow.demo.duration_ms"]["total_ms"], 12);
}

}  // namespace
