#pragma once
#ifndef WTTP_METRICS_H
#define WTTP_METRICS_H

#include <map>
#include <mutex>
#include <string>

namespace wttp {

using MetricLabels = std::map<std::string, std::string>;

/**
 * @brief Process-wide metrics registry that exports Prometheus text format.
 */
class MetricsRegistry {
public:
  /** Get singleton instance. */
  static MetricsRegistry &instance();

  /** Set gauge value with optional labels. */
  void setGauge(const std::string &name, double value,
                const MetricLabels &labels = {});

  /** Increment counter by value (default 1). */
  void incrementCounter(const std::string &name, double value = 1.0,
                        const MetricLabels &labels = {});

  /** Current counter value, 0 when never incremented. */
  double counterValue(const std::string &name,
                      const MetricLabels &labels = {}) const;

  /** Current gauge value, 0 when never set. */
  double gaugeValue(const std::string &name,
                    const MetricLabels &labels = {}) const;

  /** Serialize all metrics in Prometheus text format, sorted by series. */
  std::string toPrometheus() const;

  /** Clear all stored metrics. */
  void reset();

  /** Convert labels map to Prometheus label string. */
  static std::string labelsToString(const MetricLabels &labels);

private:
  MetricsRegistry() = default;

  mutable std::mutex mtx_;
  std::map<std::string, double> gauges_;
  std::map<std::string, double> counters_;
};

} // namespace wttp

#endif // WTTP_METRICS_H
