#include "meter/net/router.h"

#include <utility>

#include "meter/util/log.h"

namespace meter::net {

Router::Router(sensor::MeasurementGate& gate, metrics::MetricRegistry& registry) : gate_(gate), registry_(registry) {}

HttpResponse Router::handle(std::string_view method, std::string_view path) {
  static constexpr Route kRoutes[] = {
      {"GET", "/metrics", &Router::serve_metrics},
  };

  for (const Route& r : kRoutes) {
    if (r.method == method && r.path == path) return (this->*r.handler)();
  }
  return HttpResponse{404, nullptr, {}};
}

HttpResponse Router::serve_metrics() {
  Measurement m{};
  const Status st = gate_.measure(m);
  if (!st.ok()) {
    meter::util::log_status(meter::util::LogLevel::kWarn, "scrape failed", st);
    return HttpResponse{st.code == StatusCode::kSensorFault ? 503 : 500, nullptr, {}};
  }

  std::string body;
  const Status enc = registry_.encode(body);
  if (!enc.ok()) {
    meter::util::log_status(meter::util::LogLevel::kError, "encode metrics failed", enc);
    return HttpResponse{500, nullptr, {}};
  }

  meter::util::log(meter::util::LogLevel::kDebug, "scrape ok: temperature=%.2f pressure=%.1f humidity=%.2f",
                   m.temperature_c, m.pressure_pa, m.humidity_pct);
  return HttpResponse{200, metrics::kExpositionContentType, std::move(body)};
}

}  // namespace meter::net
