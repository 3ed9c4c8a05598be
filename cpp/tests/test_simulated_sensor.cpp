#include "minitest.h"

#include <cmath>
#include <string>

#include "meter/sensor/simulated_sensor.h"

using meter::Measurement;
using meter::sensor::SimulatedSensor;

METER_TEST_CASE("simulated sensor initializes and reads plausible values") {
  SimulatedSensor sensor;
  REQUIRE(std::string(sensor.name()) == "simulated");
  REQUIRE(sensor.init().ok());

  for (int i = 0; i < 3; ++i) {
    Measurement m{};
    REQUIRE(sensor.measure(m).ok());
    REQUIRE(std::isfinite(m.temperature_c));
    REQUIRE(std::isfinite(m.pressure_pa));
    REQUIRE(std::isfinite(m.humidity_pct));
    REQUIRE(m.temperature_c >= 19.5);
    REQUIRE(m.temperature_c <= 22.5);
    REQUIRE(m.pressure_pa >= 101205.0);
    REQUIRE(m.pressure_pa <= 101445.0);
    REQUIRE(m.humidity_pct >= 37.0);
    REQUIRE(m.humidity_pct <= 53.0);
  }
}
