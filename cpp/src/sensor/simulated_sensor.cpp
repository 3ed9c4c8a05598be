#include "meter/sensor/simulated_sensor.h"

#include <cmath>

#include "meter/util/time.h"

namespace meter::sensor {

SimulatedSensor::SimulatedSensor() : start_ms_(meter::util::monotonic_ms()) {}

Status SimulatedSensor::init() {
  start_ms_ = meter::util::monotonic_ms();
  return Status::Ok();
}

Status SimulatedSensor::measure(Measurement& out) {
  const std::uint64_t t = meter::util::monotonic_ms() - start_ms_;
  const double seconds = static_cast<double>(t % 3600000ULL) / 1000.0;

  out.temperature_c = 21.0 + 1.5 * std::sin(seconds * 0.01);
  out.pressure_pa = 101325.0 + 120.0 * std::sin(seconds * 0.002);
  out.humidity_pct = 45.0 + 8.0 * std::sin(seconds * 0.005);
  return Status::Ok();
}

}  // namespace meter::sensor
