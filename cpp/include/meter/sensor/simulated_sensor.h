#pragma once

#include <cstdint>

#include "meter/sensor/sensor_driver.h"

namespace meter::sensor {

// Smooth synthetic indoor-climate readings, for running without a bus device.
class SimulatedSensor final : public SensorDriver {
 public:
  SimulatedSensor();

  const char* name() const override { return "simulated"; }
  Status init() override;
  Status measure(Measurement& out) override;

 private:
  std::uint64_t start_ms_{0};
};

}  // namespace meter::sensor
