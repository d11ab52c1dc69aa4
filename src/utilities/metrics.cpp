#include "utilities/metrics.h"

#include <set>
#include <sstream>

namespace wttp {

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry inst;
  return inst;
}

static std::string seriesKey(const std::string &name,
                             const MetricLabels &labels) {
  return name + MetricsRegistry::labelsToString(labels);
}

static std::string metricName(const std::string &key) {
  return key.substr(0, key.find('{'));
}

void MetricsRegistry::setGauge(const std::string &name, double value,
                               const MetricLabels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_[seriesKey(name, labels)] = value;
}

void MetricsRegistry::incrementCounter(const std::string &name, double value,
                                       const MetricLabels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  counters_[seriesKey(name, labels)] += value;
}

double MetricsRegistry::counterValue(const std::string &name,
                                     const MetricLabels &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = counters_.find(seriesKey(name, labels));
  return it == counters_.end() ? 0.0 : it->second;
}

double MetricsRegistry::gaugeValue(const std::string &name,
                                   const MetricLabels &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = gauges_.find(seriesKey(name, labels));
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
  std::set<std::string> typed;
  for (const auto &kv : gauges_) {
    std::string name = metricName(kv.first);
    if (typed.insert(name).second)
      oss << "# TYPE " << name << " gauge\n";
    oss << kv.first << ' ' << kv.second << '\n';
  }
  for (const auto &kv : counters_) {
    std::string name = metricName(kv.first);
    if (typed.insert(name).second)
      oss << "# TYPE " << name << " counter\n";
    oss << kv.first << ' ' << kv.second << '\n';
  }
  return oss.str();
}

void MetricsRegistry::reset() {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_.clear();
  counters_.clear();
}

} // namespace wttp
