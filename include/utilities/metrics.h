#pragma once
#ifndef APPENDFS_METRICS_H
#define APPENDFS_METRICS_H

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace appendfs {

using MetricLabels = std::map<std::string, std::string>;

/**
 * @brief Process-wide registry exporting gauges, counters and summaries in
 * Prometheus text format.
 */
class MetricsRegistry {
public:
  static MetricsRegistry &instance();

  void setGauge(const std::string &name, double value,
                const MetricLabels &labels = {});
  void addToGauge(const std::string &name, double delta,
                  const MetricLabels &labels = {});
  void incrementCounter(const std::string &name, double value = 1.0,
                        const MetricLabels &labels = {});
  /** Record one observation into a sum/count summary. */
  void observe(const std::string &name, double value,
               const MetricLabels &labels = {});

  /** Current counter value, 0 if never incremented. */
  double counterValue(const std::string &name,
                      const MetricLabels &labels = {}) const;
  double gaugeValue(const std::string &name,
                    const MetricLabels &labels = {}) const;

  std::string toPrometheus() const;

  /** Clear all metrics. Used by unit tests. */
  void reset();

  static std::string labelsToString(const MetricLabels &labels);

private:
  MetricsRegistry() = default;
  struct Summary {
    double sum{0};
    unsigned long count{0};
  };

  mutable std::mutex mtx_;
  std::unordered_map<std::string, double> gauges_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, Summary> summaries_;
};

/**
 * @brief Observes the lifetime of a scope into
 * `appendfs_fuse_latency_seconds{op=...}`.
 */
class ScopedLatency {
public:
  explicit ScopedLatency(std::string op) : op_(std::move(op)) {}
  ~ScopedLatency();

  ScopedLatency(const ScopedLatency &) = delete;
  ScopedLatency &operator=(const ScopedLatency &) = delete;

private:
  std::string op_;
  std::chrono::steady_clock::time_point start_{
      std::chrono::steady_clock::now()};
};

} // namespace appendfs

#endif // APPENDFS_METRICS_H
