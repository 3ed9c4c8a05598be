#pragma once

#include <cstddef>
#include <cstdint>

#include "meter/status.h"

namespace meter::sensor {

// Byte-register access to one device on a two-wire bus.
class RegisterBus {
 public:
  virtual ~RegisterBus() = default;
  virtual Status open() = 0;
  virtual Status write_register(std::uint8_t reg, std::uint8_t value) = 0;
  // Reads len consecutive registers starting at reg (auto-increment).
  virtual Status read_registers(std::uint8_t reg, std::uint8_t* buf, std::size_t len) = 0;
};

}  // namespace meter::sensor
