#include "meter/sensor/linux_i2c_bus.h"

#include <cerrno>
#include <fcntl.h>
#include <linux/i2c.h>
#include <linux/i2c-dev.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <utility>

namespace meter::sensor {

LinuxI2cBus::LinuxI2cBus(std::string device_path, std::uint8_t address)
    : device_path_(std::move(device_path)), address_(address) {}

LinuxI2cBus::~LinuxI2cBus() {
  if (fd_ >= 0) ::close(fd_);
}

Status LinuxI2cBus::open() {
  if (fd_ >= 0) return Status::Ok();

  const int fd = ::open(device_path_.c_str(), O_RDWR | O_CLOEXEC);
  if (fd < 0) return Status::IoError("open i2c device failed", errno);

  if (::ioctl(fd, I2C_SLAVE, static_cast<unsigned long>(address_)) < 0) {
    const int err = errno;
    ::close(fd);
    return Status::IoError("select i2c address failed", err);
  }

  fd_ = fd;
  return Status::Ok();
}

Status LinuxI2cBus::write_register(std::uint8_t reg, std::uint8_t value) {
  if (fd_ < 0) return Status::IoError("i2c bus not open");

  const std::uint8_t out[2] = {reg, value};
  const ssize_t n = ::write(fd_, out, sizeof(out));
  if (n < 0) return Status::IoError("i2c write failed", errno);
  if (n != static_cast<ssize_t>(sizeof(out))) return Status::IoError("i2c short write");
  return Status::Ok();
}

Status LinuxI2cBus::read_registers(std::uint8_t reg, std::uint8_t* buf, std::size_t len) {
  if (fd_ < 0) return Status::IoError("i2c bus not open");
  if (len == 0) return Status::Ok();
  if (len > 0xFFFF) return Status::InvalidArgument("i2c read too large");

  // Register address write and data read in one transfer (repeated start).
  std::uint8_t start = reg;
  i2c_msg msgs[2]{};
  msgs[0].addr = address_;
  msgs[0].flags = 0;
  msgs[0].len = 1;
  msgs[0].buf = &start;
  msgs[1].addr = address_;
  msgs[1].flags = I2C_M_RD;
  msgs[1].len = static_cast<__u16>(len);
  msgs[1].buf = buf;

  i2c_rdwr_ioctl_data xfer{};
  xfer.msgs = msgs;
  xfer.nmsgs = 2;
  if (::ioctl(fd_, I2C_RDWR, &xfer) < 0) return Status::IoError("i2c read failed", errno);
  return Status::Ok();
}

}  // namespace meter::sensor
