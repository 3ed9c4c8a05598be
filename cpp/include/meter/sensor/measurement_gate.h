#pragma once

#include <memory>
#include <mutex>

#include "meter/measurement.h"
#include "meter/metrics/registry.h"
#include "meter/sensor/sensor_driver.h"
#include "meter/status.h"

namespace meter::sensor {

// Sole owner of the sensor driver. Serializes every hardware transaction and
// publishes successful readings to the environment gauges.
//
// Gauges are written while the gate is still held and through one registry
// update, so an encode never sees values from two different readings.
class MeasurementGate final {
 public:
  MeasurementGate(std::unique_ptr<SensorDriver> driver, metrics::MetricRegistry& registry);

  MeasurementGate(const MeasurementGate&) = delete;
  MeasurementGate& operator=(const MeasurementGate&) = delete;

  // Driver failures come back as kInitFailed.
  Status init();

  // Blocks until the sensor is free. Driver failures come back as
  // kSensorFault and leave the gauges untouched.
  Status measure(Measurement& out);

  bool initialized() const;
  const char* sensor_name() const;

 private:
  mutable std::mutex mu_;
  std::unique_ptr<SensorDriver> driver_;
  metrics::MetricRegistry& registry_;
  bool initialized_{false};
};

}  // namespace meter::sensor
