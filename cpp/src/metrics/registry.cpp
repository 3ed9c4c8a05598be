#include "meter/metrics/registry.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <utility>

namespace meter::metrics {

namespace {

static bool is_name_start(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == ':'; }

static bool is_name_char(char c) { return is_name_start(c) || (c >= '0' && c <= '9'); }

static void append_escaped_help(std::string& out, std::string_view help) {
  for (char c : help) {
    if (c == '\\') {
      out += "\\\\";
    } else if (c == '\n') {
      out += "\\n";
    } else {
      out += c;
    }
  }
}

}  // namespace

bool is_valid_metric_name(std::string_view name) {
  if (name.empty() || !is_name_start(name.front())) return false;
  return std::all_of(name.begin(), name.end(), is_name_char);
}

bool format_sample_value(double v, char* buf, std::size_t size) {
  int n = 0;
  if (std::isnan(v)) {
    n = std::snprintf(buf, size, "NaN");
  } else if (std::isinf(v)) {
    n = std::snprintf(buf, size, "%s", v > 0 ? "+Inf" : "-Inf");
  } else if (v == std::floor(v) && std::fabs(v) < 1e15) {
    // Whole numbers in plain digits, never exponent form.
    n = std::snprintf(buf, size, "%.0f", v == 0.0 ? 0.0 : v);
  } else {
    for (int precision = 1; precision <= 17; ++precision) {
      n = std::snprintf(buf, size, "%.*g", precision, v);
      if (n <= 0 || static_cast<std::size_t>(n) >= size) return false;
      if (std::strtod(buf, nullptr) == v) break;
    }
  }
  return n > 0 && static_cast<std::size_t>(n) < size;
}

Status MetricRegistry::register_gauge(std::string_view name, std::string_view help) {
  if (!is_valid_metric_name(name)) return Status::InvalidArgument("invalid metric name");

  std::lock_guard<std::mutex> lock(mu_);
  const auto it = std::lower_bound(gauges_.begin(), gauges_.end(), name,
                                   [](const Gauge& g, std::string_view n) { return g.name < n; });
  if (it != gauges_.end() && it->name == name) return Status::InvalidArgument("metric already registered");
  gauges_.insert(it, Gauge{std::string(name), std::string(help), 0.0});
  return Status::Ok();
}

std::size_t MetricRegistry::index_locked(std::string_view name) const {
  const auto it = std::lower_bound(gauges_.begin(), gauges_.end(), name,
                                   [](const Gauge& g, std::string_view n) { return g.name < n; });
  if (it == gauges_.end() || it->name != name) return kNotFound;
  return static_cast<std::size_t>(it - gauges_.begin());
}

Status MetricRegistry::set(std::string_view name, double value) {
  std::lock_guard<std::mutex> lock(mu_);
  const std::size_t i = index_locked(name);
  if (i == kNotFound) return Status::InvalidArgument("unknown metric");
  gauges_[i].value = value;
  return Status::Ok();
}

Status MetricRegistry::set_all(std::initializer_list<GaugeValue> values) {
  std::lock_guard<std::mutex> lock(mu_);
  for (const GaugeValue& v : values) {
    if (index_locked(v.name) == kNotFound) return Status::InvalidArgument("unknown metric");
  }
  for (const GaugeValue& v : values) gauges_[index_locked(v.name)].value = v.value;
  return Status::Ok();
}

bool MetricRegistry::get(std::string_view name, double& out) const {
  std::lock_guard<std::mutex> lock(mu_);
  const std::size_t i = index_locked(name);
  if (i == kNotFound) return false;
  out = gauges_[i].value;
  return true;
}

std::size_t MetricRegistry::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return gauges_.size();
}

Status MetricRegistry::encode(std::string& out) const {
  std::lock_guard<std::mutex> lock(mu_);
  std::string text;
  text.reserve(gauges_.size() * 128);

  for (const Gauge& g : gauges_) {
    char value[64];
    if (!format_sample_value(g.value, value, sizeof(value))) return Status::EncodingFailed("format sample value failed");

    text += "# HELP ";
    text += g.name;
    text += ' ';
    append_escaped_help(text, g.help);
    text += "\n# TYPE ";
    text += g.name;
    text += " gauge\n";
    text += g.name;
    text += ' ';
    text += value;
    text += '\n';
  }

  out = std::move(text);
  return Status::Ok();
}

}  // namespace meter::metrics
