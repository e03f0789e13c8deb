#include "utilities/metrics.h"

#include <sstream>

namespace appendfs {

namespace {

std::string makeKey(const std::string &name, const MetricLabels &labels) {
  return name + MetricsRegistry::labelsToString(labels);
}

// Split "name{labels}" back into its two parts.
void splitKey(const std::string &key, std::string &name, std::string &labels) {
  auto pos = key.find('{');
  name = key.substr(0, pos);
  labels = pos == std::string::npos ? "" : key.substr(pos);
}

} // namespace

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry inst;
  return inst;
}

void MetricsRegistry::setGauge(const std::string &name, double value,
                               const MetricLabels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_[makeKey(name, labels)] = value;
}

void MetricsRegistry::addToGauge(const std::string &name, double delta,
                                 const MetricLabels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_[makeKey(name, labels)] += delta;
}

void MetricsRegistry::incrementCounter(const std::string &name, double value,
                                       const MetricLabels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  counters_[makeKey(name, labels)] += value;
}

void MetricsRegistry::observe(const std::string &name, double value,
                              const MetricLabels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  auto &s = summaries_[makeKey(name, labels)];
  s.sum += value;
  s.count += 1;
}

double MetricsRegistry::counterValue(const std::string &name,
                                     const MetricLabels &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = counters_.find(makeKey(name, labels));
  return it == counters_.end() ? 0.0 : it->second;
}

double MetricsRegistry::gaugeValue(const std::string &name,
                                   const MetricLabels &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = gauges_.find(makeKey(name, labels));
  return it == gauges_.end() ? 0.0 : it->second;
}

std::string MetricsRegistry::labelsToString(const MetricLabels &labels) {
  if (labels.empty())
    return "";
  std::ostringstream oss;
  oss << '{';
  bool first = true;
  for (const auto &kv : labels) {
    if (!first)
      oss << ',';
    first = false;
    oss << kv.first << "=\"" << kv.second << "\"";
  }
  oss << '}';
  return oss.str();
}

std::string MetricsRegistry::toPrometheus() const {
  std::lock_guard<std::mutex> lg(mtx_);
  std::ostringstream oss;
  std::string name;
  std::string labels;
  for (const auto &kv : gauges_) {
    splitKey(kv.first, name, labels);
    oss << name << labels << ' ' << kv.second << '\n';
  }
  for (const auto &kv : counters_) {
    splitKey(kv.first, name, labels);
    oss << name << labels << ' ' << kv.second << '\n';
  }
  for (const auto &kv : summaries_) {
    splitKey(kv.first, name, labels);
    oss << name << "_sum" << labels << ' ' << kv.second.sum << '\n';
    oss << name << "_count" << labels << ' ' << kv.second.count << '\n';
  }
  return oss.str();
}

void MetricsRegistry::reset() {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_.clear();
  counters_.clear();
  summaries_.clear();
}

ScopedLatency::~ScopedLatency() {
  auto dur = std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                           start_)
                 .count();
  MetricsRegistry::instance().observe("appendfs_fuse_latency_seconds", dur,
                                      {{"op", op_}});
}

} // namespace appendfs
