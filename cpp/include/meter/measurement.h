#pragma once

namespace meter {

// One reading from the environmental sensor.
struct Measurement final {
  // Celsius.
  double temperature_c{0.0};

  // Pascals.
  double pressure_pa{0.0};

  // Relative humidity, percent.
  double humidity_pct{0.0};
};

}  // namespace meter
