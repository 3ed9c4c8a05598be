#include "meter/metrics/environment_gauges.h"

namespace meter::metrics {

Status register_environment_gauges(MetricRegistry& registry) {
  Status st = registry.register_gauge(kTemperatureGauge, "Ambient temperature in Celsius");
  if (!st.ok()) return st;
  st = registry.register_gauge(kPressureGauge, "Atmospheric pressure in Pascals");
  if (!st.ok()) return st;
  return registry.register_gauge(kHumidityGauge, "Relative humidity in %");
}

}  // namespace meter::metrics
