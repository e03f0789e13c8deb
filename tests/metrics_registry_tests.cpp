#include <gtest/gtest.h>
#include "utilities/metrics.h"

using appendfs::MetricsRegistry;

/**
 * @brief Verify correct formatting of label strings in Prometheus format.
 */
TEST(MetricsRegistry, LabelsToString) {
    std::map<std::string,std::string> labels{{"op","write"},{"outcome","fresh"}};
    std::string formatted = MetricsRegistry::labelsToString(labels);
    // Map iteration is ordered, so "op" comes before "outcome".
    EXPECT_EQ(formatted, "{op=\"write\",outcome=\"fresh\"}");
    EXPECT_EQ(MetricsRegistry::labelsToString({}), "");
}

/**
 * @brief Validate gauge, counter and summary reporting.
 */
TEST(MetricsRegistry, BasicRecording) {
    MetricsRegistry::instance().reset();
    MetricsRegistry::instance().addToGauge("appendfs_open_write_streams", 2);
    MetricsRegistry::instance().addToGauge("appendfs_open_write_streams", -1);
    MetricsRegistry::instance().incrementCounter("appendfs_stream_bytes_written_total", 3);
    MetricsRegistry::instance().incrementCounter("appendfs_stream_open_total", 1, {{"outcome","fresh"}});
    MetricsRegistry::instance().observe("appendfs_fuse_latency_seconds", 1.5, {{"op","write"}});
    std::string metrics = MetricsRegistry::instance().toPrometheus();
    EXPECT_NE(metrics.find("appendfs_open_write_streams 1"), std::string::npos);
    EXPECT_NE(metrics.find("appendfs_stream_bytes_written_total 3"), std::string::npos);
    EXPECT_NE(metrics.find("appendfs_stream_open_total{outcome=\"fresh\"} 1"), std::string::npos);
    EXPECT_NE(metrics.find("appendfs_fuse_latency_seconds_sum{op=\"write\"} 1.5"), std::string::npos);
    EXPECT_NE(metrics.find("appendfs_fuse_latency_seconds_count{op=\"write\"} 1"), std::string::npos);
    EXPECT_EQ(MetricsRegistry::instance().gaugeValue("appendfs_open_write_streams"), 1.0);
    EXPECT_EQ(MetricsRegistry::instance().counterValue("appendfs_stream_open_total", {{"outcome","deferred_existing"}}), 0.0);
    MetricsRegistry::instance().reset();
    EXPECT_TRUE(MetricsRegistry::instance().toPrometheus().empty());
}

/**
 * @brief ScopedLatency records one observation per scope.
 */
TEST(MetricsRegistry, ScopedLatencyObserves) {
    MetricsRegistry::instance().reset();
    {
        appendfs::ScopedLatency timer("getattr");
    }
    std::string metrics = MetricsRegistry::instance().toPrometheus();
    EXPECT_NE(metrics.find("appendfs_fuse_latency_seconds_count{op=\"getattr\"} 1"), std::string::npos);
}
