#include "meter/exporter.h"

#include <utility>

#include "meter/metrics/environment_gauges.h"

namespace meter {

Exporter::Exporter(std::unique_ptr<sensor::SensorDriver> driver, net::HttpServerConfig cfg)
    : gate_(std::move(driver), registry_), router_(gate_, registry_), server_(router_, cfg) {}

Status Exporter::start() {
  Status st = gate_.init();
  if (!st.ok()) return st;

  if (registry_.size() == 0) {
    st = metrics::register_environment_gauges(registry_);
    if (!st.ok()) return st;
  }

  return server_.listen();
}

Status Exporter::run() {
  if (!server_.listening()) return Status::Internal("exporter not started");
  return server_.run_forever();
}

}  // namespace meter
