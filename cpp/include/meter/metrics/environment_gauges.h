#pragma once

#include "meter/metrics/registry.h"

namespace meter::metrics {

inline constexpr const char* kTemperatureGauge = "meter_temperature_celsius";
inline constexpr const char* kPressureGauge = "meter_pressure_pascals";
inline constexpr const char* kHumidityGauge = "meter_humidity_percent";

// Registers the three gauges written by the measurement gate.
Status register_environment_gauges(MetricRegistry& registry);

}  // namespace meter::metrics
