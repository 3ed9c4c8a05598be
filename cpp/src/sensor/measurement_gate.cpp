#include "meter/sensor/measurement_gate.h"

#include <utility>

#include "meter/metrics/environment_gauges.h"

namespace meter::sensor {

MeasurementGate::MeasurementGate(std::unique_ptr<SensorDriver> driver, metrics::MetricRegistry& registry)
    : driver_(std::move(driver)), registry_(registry) {}

Status MeasurementGate::init() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!driver_) return Status::InitFailed("no sensor driver");

  const Status st = driver_->init();
  if (!st.ok()) return st.as(StatusCode::kInitFailed);
  initialized_ = true;
  return Status::Ok();
}

Status MeasurementGate::measure(Measurement& out) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_) return Status::SensorFault("sensor not initialized");

  Measurement m{};
  const Status st = driver_->measure(m);
  if (!st.ok()) return st.as(StatusCode::kSensorFault);

  const Status set = registry_.set_all({
      {metrics::kTemperatureGauge, m.temperature_c},
      {metrics::kPressureGauge, m.pressure_pa},
      {metrics::kHumidityGauge, m.humidity_pct},
  });
  if (!set.ok()) return set;

  out = m;
  return Status::Ok();
}

bool MeasurementGate::initialized() const {
  std::lock_guard<std::mutex> lock(mu_);
  return initialized_;
}

const char* MeasurementGate::sensor_name() const { return driver_ ? driver_->name() : "none"; }

}  // namespace meter::sensor
