#pragma once

#include "meter/measurement.h"
#include "meter/status.h"

namespace meter::sensor {

class SensorDriver {
 public:
  virtual ~SensorDriver() = default;
  virtual const char* name() const = 0;
  virtual Status init() = 0;
  // One blocking hardware transaction.
  virtual Status measure(Measurement& out) = 0;
};

}  // namespace meter::sensor
