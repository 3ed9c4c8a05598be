#pragma once

#include <cstdint>
#include <memory>

#include "meter/metrics/registry.h"
#include "meter/net/http_server.h"
#include "meter/net/router.h"
#include "meter/sensor/measurement_gate.h"
#include "meter/sensor/sensor_driver.h"
#include "meter/status.h"

namespace meter {

// Owns the registry, the sensor gate, the router and the HTTP server.
class Exporter final {
 public:
  Exporter(std::unique_ptr<sensor::SensorDriver> driver, net::HttpServerConfig cfg);

  Exporter(const Exporter&) = delete;
  Exporter& operator=(const Exporter&) = delete;

  // Initializes the sensor, registers the gauges and binds the listener.
  // A sensor that fails to initialize yields kInitFailed and nothing is bound.
  Status start();

  // Serves until stop() or the configured run time elapses.
  Status run();

  void stop() { server_.stop(); }

  bool serving() const { return server_.listening(); }
  std::uint16_t port() const { return server_.port(); }
  const char* sensor_name() const { return gate_.sensor_name(); }
  metrics::MetricRegistry& registry() { return registry_; }

 private:
  metrics::MetricRegistry registry_;
  sensor::MeasurementGate gate_;
  net::Router router_;
  net::HttpServer server_;
};

}  // namespace meter
