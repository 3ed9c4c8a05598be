#pragma once

#include <cstdint>
#include <memory>

#include "meter/sensor/register_bus.h"
#include "meter/sensor/sensor_driver.h"

namespace meter::sensor {

// Bosch BME280 humidity/pressure/temperature sensor in forced mode.
class Bme280 final : public SensorDriver {
 public:
  // SDO tied to GND.
  static constexpr std::uint8_t kPrimaryAddress = 0x76;
  // SDO tied to VDDIO.
  static constexpr std::uint8_t kSecondaryAddress = 0x77;

  static constexpr std::uint8_t kChipId = 0x60;

  // Factory trimming parameters, read once during init().
  struct Calibration final {
    std::uint16_t dig_t1{0};
    std::int16_t dig_t2{0};
    std::int16_t dig_t3{0};

    std::uint16_t dig_p1{0};
    std::int16_t dig_p2{0};
    std::int16_t dig_p3{0};
    std::int16_t dig_p4{0};
    std::int16_t dig_p5{0};
    std::int16_t dig_p6{0};
    std::int16_t dig_p7{0};
    std::int16_t dig_p8{0};
    std::int16_t dig_p9{0};

    std::uint8_t dig_h1{0};
    std::int16_t dig_h2{0};
    std::uint8_t dig_h3{0};
    std::int16_t dig_h4{0};
    std::int16_t dig_h5{0};
    std::int8_t dig_h6{0};
  };

  explicit Bme280(std::unique_ptr<RegisterBus> bus);

  const char* name() const override { return "bme280"; }
  Status init() override;
  Status measure(Measurement& out) override;

  const Calibration& calibration() const { return calib_; }

  // Datasheet floating-point compensation. t_fine is produced by the
  // temperature step and consumed by the other two.
  static double compensate_temperature(const Calibration& c, std::int32_t adc_t, double& t_fine);
  static bool compensate_pressure(const Calibration& c, std::int32_t adc_p, double t_fine, double& out_pa);
  static double compensate_humidity(const Calibration& c, std::int32_t adc_h, double t_fine);

 private:
  Status read_calibration();
  Status wait_while_status(std::uint8_t mask, int attempts);

  std::unique_ptr<RegisterBus> bus_;
  Calibration calib_{};
  bool initialized_{false};
};

}  // namespace meter::sensor
