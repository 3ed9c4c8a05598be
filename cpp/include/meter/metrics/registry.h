#pragma once

#include <initializer_list>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "meter/status.h"

namespace meter::metrics {

// Content type of encode() output.
inline constexpr const char* kExpositionContentType = "text/plain; version=0.0.4; charset=utf-8";

struct GaugeValue final {
  std::string_view name;
  double value{0.0};
};

// Named gauges plus the text encoder for the Prometheus exposition format.
// Thread-safe.
class MetricRegistry final {
 public:
  MetricRegistry() = default;
  MetricRegistry(const MetricRegistry&) = delete;
  MetricRegistry& operator=(const MetricRegistry&) = delete;

  // New gauges start at 0. Duplicate or malformed names are kInvalidArgument.
  Status register_gauge(std::string_view name, std::string_view help);

  Status set(std::string_view name, double value);

  // All-or-nothing: no gauge changes unless every name is registered.
  Status set_all(std::initializer_list<GaugeValue> values);

  bool get(std::string_view name, double& out) const;
  std::size_t size() const;

  // Families in name order, so equal values give byte-identical output.
  Status encode(std::string& out) const;

 private:
  struct Gauge final {
    std::string name;
    std::string help;
    double value{0.0};
  };

  static constexpr std::size_t kNotFound = static_cast<std::size_t>(-1);

  // Caller holds mu_.
  std::size_t index_locked(std::string_view name) const;

  mutable std::mutex mu_;
  std::vector<Gauge> gauges_;  // sorted by name
};

// Metric names are [a-zA-Z_:][a-zA-Z0-9_:]*.
bool is_valid_metric_name(std::string_view name);

// Whole numbers below 1e15 as plain digits, other finite values as the shortest
// decimal text that parses back to the same double; NaN, +Inf, -Inf otherwise.
bool format_sample_value(double v, char* buf, std::size_t size);

}  // namespace meter::metrics
