#include "meter/sensor/bme280.h"

#include <array>
#include <chrono>
#include <thread>
#include <utility>

namespace meter::sensor {

namespace {

constexpr std::uint8_t kRegCalib00 = 0x88;
constexpr std::uint8_t kRegChipId = 0xD0;
constexpr std::uint8_t kRegReset = 0xE0;
constexpr std::uint8_t kRegCalib26 = 0xE1;
constexpr std::uint8_t kRegCtrlHum = 0xF2;
constexpr std::uint8_t kRegStatus = 0xF3;
constexpr std::uint8_t kRegCtrlMeas = 0xF4;
constexpr std::uint8_t kRegConfig = 0xF5;
constexpr std::uint8_t kRegData = 0xF7;

constexpr std::uint8_t kSoftResetCommand = 0xB6;

constexpr std::uint8_t kStatusMeasuring = 0x08;
constexpr std::uint8_t kStatusImUpdate = 0x01;

// osrs x1 for all three channels; mode bits [1:0].
constexpr std::uint8_t kOversamplingX1 = 0x01;
constexpr std::uint8_t kModeSleep = 0x00;
constexpr std::uint8_t kModeForced = 0x01;
constexpr std::uint8_t kCtrlMeasBase = static_cast<std::uint8_t>((kOversamplingX1 << 5) | (kOversamplingX1 << 2));

// Filter off, standby unused in forced mode.
constexpr std::uint8_t kConfigValue = 0x00;

constexpr std::size_t kCalib00Len = 26;
constexpr std::size_t kCalib26Len = 7;
constexpr std::size_t kDataLen = 8;

// Max conversion time at x1 oversampling is 9.3 ms.
constexpr auto kConversionTime = std::chrono::milliseconds(10);
constexpr auto kPollInterval = std::chrono::milliseconds(2);
constexpr int kPollAttempts = 25;

constexpr std::int32_t kSkippedPressureOrTemp = 0x80000;
constexpr std::int32_t kSkippedHumidity = 0x8000;

static std::uint16_t u16_le(const std::uint8_t* p) {
  return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

static std::int16_t s16_le(const std::uint8_t* p) { return static_cast<std::int16_t>(u16_le(p)); }

}  // namespace

Bme280::Bme280(std::unique_ptr<RegisterBus> bus) : bus_(std::move(bus)) {}

Status Bme280::init() {
  initialized_ = false;
  if (!bus_) return Status::InvalidArgument("no bus");

  Status st = bus_->open();
  if (!st.ok()) return st;

  st = bus_->write_register(kRegReset, kSoftResetCommand);
  if (!st.ok()) return st;
  std::this_thread::sleep_for(std::chrono::milliseconds(2));

  // NVM data is copied to the image registers after reset.
  st = wait_while_status(kStatusImUpdate, kPollAttempts);
  if (!st.ok()) return st;

  std::uint8_t chip_id = 0;
  st = bus_->read_registers(kRegChipId, &chip_id, 1);
  if (!st.ok()) return st;
  if (chip_id != kChipId) return Status::IoError("unexpected chip id");

  st = read_calibration();
  if (!st.ok()) return st;

  st = bus_->write_register(kRegConfig, kConfigValue);
  if (!st.ok()) return st;
  // ctrl_hum only takes effect after the following ctrl_meas write.
  st = bus_->write_register(kRegCtrlHum, kOversamplingX1);
  if (!st.ok()) return st;
  st = bus_->write_register(kRegCtrlMeas, kCtrlMeasBase | kModeSleep);
  if (!st.ok()) return st;

  initialized_ = true;
  return Status::Ok();
}

Status Bme280::read_calibration() {
  std::array<std::uint8_t, kCalib00Len> a{};
  Status st = bus_->read_registers(kRegCalib00, a.data(), a.size());
  if (!st.ok()) return st;

  std::array<std::uint8_t, kCalib26Len> b{};
  st = bus_->read_registers(kRegCalib26, b.data(), b.size());
  if (!st.ok()) return st;

  Calibration c{};
  c.dig_t1 = u16_le(&a[0]);
  c.dig_t2 = s16_le(&a[2]);
  c.dig_t3 = s16_le(&a[4]);
  c.dig_p1 = u16_le(&a[6]);
  c.dig_p2 = s16_le(&a[8]);
  c.dig_p3 = s16_le(&a[10]);
  c.dig_p4 = s16_le(&a[12]);
  c.dig_p5 = s16_le(&a[14]);
  c.dig_p6 = s16_le(&a[16]);
  c.dig_p7 = s16_le(&a[18]);
  c.dig_p8 = s16_le(&a[20]);
  c.dig_p9 = s16_le(&a[22]);
  // a[24] (0xA0) is unused.
  c.dig_h1 = a[25];

  c.dig_h2 = s16_le(&b[0]);
  c.dig_h3 = b[2];
  // H4 and H5 are 12-bit signed values sharing the nibbles of 0xE5.
  c.dig_h4 = static_cast<std::int16_t>((static_cast<std::int8_t>(b[3]) * 16) | (b[4] & 0x0F));
  c.dig_h5 = static_cast<std::int16_t>((static_cast<std::int8_t>(b[5]) * 16) | (b[4] >> 4));
  c.dig_h6 = static_cast<std::int8_t>(b[6]);

  if (c.dig_t1 == 0 || c.dig_p1 == 0) return Status::IoError("calibration data blank");
  calib_ = c;
  return Status::Ok();
}

Status Bme280::wait_while_status(std::uint8_t mask, int attempts) {
  for (int i = 0; i < attempts; ++i) {
    std::uint8_t status = 0;
    const Status st = bus_->read_registers(kRegStatus, &status, 1);
    if (!st.ok()) return st;
    if ((status & mask) == 0) return Status::Ok();
    std::this_thread::sleep_for(kPollInterval);
  }
  return Status::IoError("timed out waiting for sensor");
}

Status Bme280::measure(Measurement& out) {
  if (!initialized_) return Status::InvalidArgument("sensor not initialized");

  Status st = bus_->write_register(kRegCtrlMeas, kCtrlMeasBase | kModeForced);
  if (!st.ok()) return st;

  std::this_thread::sleep_for(kConversionTime);
  st = wait_while_status(kStatusMeasuring, kPollAttempts);
  if (!st.ok()) return st;

  std::array<std::uint8_t, kDataLen> d{};
  st = bus_->read_registers(kRegData, d.data(), d.size());
  if (!st.ok()) return st;

  const std::int32_t adc_p = (static_cast<std::int32_t>(d[0]) << 12) | (d[1] << 4) | (d[2] >> 4);
  const std::int32_t adc_t = (static_cast<std::int32_t>(d[3]) << 12) | (d[4] << 4) | (d[5] >> 4);
  const std::int32_t adc_h = (static_cast<std::int32_t>(d[6]) << 8) | d[7];

  if (adc_t == kSkippedPressureOrTemp) return Status::IoError("temperature measurement skipped");
  if (adc_p == kSkippedPressureOrTemp) return Status::IoError("pressure measurement skipped");
  if (adc_h == kSkippedHumidity) return Status::IoError("humidity measurement skipped");

  double t_fine = 0.0;
  const double temperature = compensate_temperature(calib_, adc_t, t_fine);
  double pressure = 0.0;
  if (!compensate_pressure(calib_, adc_p, t_fine, pressure)) return Status::IoError("invalid pressure calibration");

  out.temperature_c = temperature;
  out.pressure_pa = pressure;
  out.humidity_pct = compensate_humidity(calib_, adc_h, t_fine);
  return Status::Ok();
}

double Bme280::compensate_temperature(const Calibration& c, std::int32_t adc_t, double& t_fine) {
  const double var1 = (adc_t / 16384.0 - c.dig_t1 / 1024.0) * c.dig_t2;
  const double d = adc_t / 131072.0 - c.dig_t1 / 8192.0;
  const double var2 = d * d * c.dig_t3;
  t_fine = var1 + var2;
  return t_fine / 5120.0;
}

bool Bme280::compensate_pressure(const Calibration& c, std::int32_t adc_p, double t_fine, double& out_pa) {
  double var1 = t_fine / 2.0 - 64000.0;
  double var2 = var1 * var1 * c.dig_p6 / 32768.0;
  var2 = var2 + var1 * c.dig_p5 * 2.0;
  var2 = var2 / 4.0 + c.dig_p4 * 65536.0;
  var1 = (c.dig_p3 * var1 * var1 / 524288.0 + c.dig_p2 * var1) / 524288.0;
  var1 = (1.0 + var1 / 32768.0) * c.dig_p1;
  if (var1 == 0.0) return false;

  double p = 1048576.0 - adc_p;
  p = (p - var2 / 4096.0) * 6250.0 / var1;
  var1 = c.dig_p9 * p * p / 2147483648.0;
  var2 = p * c.dig_p8 / 32768.0;
  out_pa = p + (var1 + var2 + c.dig_p7) / 16.0;
  return true;
}

double Bme280::compensate_humidity(const Calibration& c, std::int32_t adc_h, double t_fine) {
  double h = t_fine - 76800.0;
  h = (adc_h - (c.dig_h4 * 64.0 + c.dig_h5 / 16384.0 * h)) *
      (c.dig_h2 / 65536.0 * (1.0 + c.dig_h6 / 67108864.0 * h * (1.0 + c.dig_h3 / 67108864.0 * h)));
  h = h * (1.0 - c.dig_h1 * h / 524288.0);
  if (h > 100.0) return 100.0;
  if (h < 0.0) return 0.0;
  return h;
}

}  // namespace meter::sensor
