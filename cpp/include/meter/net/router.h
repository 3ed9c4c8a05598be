#pragma once

#include <string_view>

#include "meter/metrics/registry.h"
#include "meter/net/http.h"
#include "meter/sensor/measurement_gate.h"

namespace meter::net {

// Maps (method, path) to a handler. Matching is exact; anything not in the
// table is a 404 with an empty body.
class Router final {
 public:
  Router(sensor::MeasurementGate& gate, metrics::MetricRegistry& registry);

  // Blocks for the duration of one sensor read on GET /metrics.
  HttpResponse handle(std::string_view method, std::string_view path);

 private:
  using Handler = HttpResponse (Router::*)();

  struct Route final {
    std::string_view method;
    std::string_view path;
    Handler handler;
  };

  HttpResponse serve_metrics();

  sensor::MeasurementGate& gate_;
  metrics::MetricRegistry& registry_;
};

}  // namespace meter::net
