#pragma once

#include <cstdint>
#include <string>

#include "meter/sensor/register_bus.h"

namespace meter::sensor {

inline constexpr const char* kDefaultI2cDevice = "/dev/i2c-1";

// i2c-dev character device, e.g. /dev/i2c-1.
class LinuxI2cBus final : public RegisterBus {
 public:
  LinuxI2cBus(std::string device_path, std::uint8_t address);
  ~LinuxI2cBus() override;

  LinuxI2cBus(const LinuxI2cBus&) = delete;
  LinuxI2cBus& operator=(const LinuxI2cBus&) = delete;

  Status open() override;
  Status write_register(std::uint8_t reg, std::uint8_t value) override;
  Status read_registers(std::uint8_t reg, std::uint8_t* buf, std::size_t len) override;

  const std::string& device_path() const { return device_path_; }
  std::uint8_t address() const { return address_; }

 private:
  std::string device_path_;
  std::uint8_t address_;
  int fd_{-1};
};

}  // namespace meter::sensor
