#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <utility>

#include "meter/exporter.h"
#include "meter/sensor/bme280.h"
#include "meter/sensor/linux_i2c_bus.h"
#include "meter/sensor/simulated_sensor.h"
#include "meter/util/log.h"

namespace {

std::atomic<meter::Exporter*> g_exporter{nullptr};

static void on_signal(int) {
  meter::Exporter* exporter = g_exporter.load();
  if (exporter) exporter->stop();
}

static void print_usage(const char* argv0) {
  std::fprintf(stderr,
               "Usage: %s [--host <ip>] [--port <port>] [--sensor bme280|simulated]\n"
               "          [--i2c-device <path>] [--i2c-address <addr>] [--idle-timeout-ms <ms>]\n"
               "          [--run-for-ms <ms>] [--log-level debug|info|warn|error]\n"
               "Defaults: --host 0.0.0.0 --port 3002 --sensor bme280 --i2c-device /dev/i2c-1\n"
               "          --i2c-address 0x76 --idle-timeout-ms 5000 --run-for-ms 0 --log-level info\n",
               argv0);
}

static bool parse_u32(const char* s, std::uint32_t& out) {
  if (!s || !*s) return false;
  unsigned long v = 0;
  for (const char* p = s; *p; ++p) {
    if (*p < '0' || *p > '9') return false;
    v = v * 10UL + static_cast<unsigned long>(*p - '0');
    if (v > 0xFFFFFFFFUL) return false;
  }
  out = static_cast<std::uint32_t>(v);
  return true;
}

static bool parse_u16(const char* s, std::uint16_t& out) {
  std::uint32_t v = 0;
  if (!parse_u32(s, v) || v > 65535U) return false;
  out = static_cast<std::uint16_t>(v);
  return true;
}

// Decimal or 0x-prefixed 7-bit address.
static bool parse_i2c_address(const char* s, std::uint8_t& out) {
  if (!s || !*s) return false;
  unsigned long v = 0;
  if (s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
    const char* p = s + 2;
    if (!*p) return false;
    for (; *p; ++p) {
      int d = 0;
      if (*p >= '0' && *p <= '9') {
        d = *p - '0';
      } else if (*p >= 'a' && *p <= 'f') {
        d = *p - 'a' + 10;
      } else if (*p >= 'A' && *p <= 'F') {
        d = *p - 'A' + 10;
      } else {
        return false;
      }
      v = v * 16UL + static_cast<unsigned long>(d);
      if (v > 0x7FUL) return false;
    }
  } else {
    std::uint32_t dec = 0;
    if (!parse_u32(s, dec) || dec > 0x7FU) return false;
    v = dec;
  }
  out = static_cast<std::uint8_t>(v);
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  meter::net::HttpServerConfig cfg{};
  std::string sensor = "bme280";
  std::string i2c_device = meter::sensor::kDefaultI2cDevice;
  std::uint8_t i2c_address = meter::sensor::Bme280::kPrimaryAddress;

  for (int i = 1; i < argc; ++i) {
    const char* a = argv[i];
    if (std::strcmp(a, "--help") == 0 || std::strcmp(a, "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    } else if (std::strcmp(a, "--host") == 0 && i + 1 < argc) {
      cfg.host = argv[++i];
    } else if (std::strcmp(a, "--port") == 0 && i + 1 < argc) {
      if (!parse_u16(argv[++i], cfg.port)) {
        std::fprintf(stderr, "Invalid --port\n");
        return 2;
      }
    } else if (std::strcmp(a, "--sensor") == 0 && i + 1 < argc) {
      sensor = argv[++i];
      if (sensor != "bme280" && sensor != "simulated") {
        std::fprintf(stderr, "Invalid --sensor\n");
        return 2;
      }
    } else if (std::strcmp(a, "--i2c-device") == 0 && i + 1 < argc) {
      i2c_device = argv[++i];
    } else if (std::strcmp(a, "--i2c-address") == 0 && i + 1 < argc) {
      if (!parse_i2c_address(argv[++i], i2c_address)) {
        std::fprintf(stderr, "Invalid --i2c-address\n");
        return 2;
      }
    } else if (std::strcmp(a, "--idle-timeout-ms") == 0 && i + 1 < argc) {
      if (!parse_u32(argv[++i], cfg.idle_timeout_ms)) {
        std::fprintf(stderr, "Invalid --idle-timeout-ms\n");
        return 2;
      }
    } else if (std::strcmp(a, "--run-for-ms") == 0 && i + 1 < argc) {
      if (!parse_u32(argv[++i], cfg.run_for_ms)) {
        std::fprintf(stderr, "Invalid --run-for-ms\n");
        return 2;
      }
    } else if (std::strcmp(a, "--log-level") == 0 && i + 1 < argc) {
      meter::util::LogLevel level{};
      if (!meter::util::parse_log_level(argv[++i], level)) {
        std::fprintf(stderr, "Invalid --log-level\n");
        return 2;
      }
      meter::util::set_log_level(level);
    } else {
      std::fprintf(stderr, "Unknown arg: %s\n", a);
      print_usage(argv[0]);
      return 2;
    }
  }

  std::unique_ptr<meter::sensor::SensorDriver> driver;
  if (sensor == "simulated") {
    driver = std::make_unique<meter::sensor::SimulatedSensor>();
  } else {
    driver = std::make_unique<meter::sensor::Bme280>(
        std::make_unique<meter::sensor::LinuxI2cBus>(i2c_device, i2c_address));
    meter::util::log(meter::util::LogLevel::kInfo, "using bme280 on %s address 0x%02x", i2c_device.c_str(),
                     static_cast<unsigned>(i2c_address));
  }

  meter::Exporter exporter(std::move(driver), cfg);
  const meter::Status st = exporter.start();
  if (!st.ok()) {
    meter::util::log_status(meter::util::LogLevel::kError, "meterd failed to start", st);
    return 1;
  }

  g_exporter.store(&exporter);
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  meter::util::log(meter::util::LogLevel::kInfo, "meterd listening on http://%s:%u/metrics sensor=%s", cfg.host,
                   static_cast<unsigned>(exporter.port()), exporter.sensor_name());
  if (cfg.run_for_ms != 0) {
    meter::util::log(meter::util::LogLevel::kInfo, "meterd will exit after run_for_ms=%u",
                     static_cast<unsigned>(cfg.run_for_ms));
  }

  const meter::Status run = exporter.run();
  g_exporter.store(nullptr);
  if (!run.ok()) {
    meter::util::log_status(meter::util::LogLevel::kError, "meterd failed", run);
    return 1;
  }
  meter::util::log(meter::util::LogLevel::kInfo, "meterd stopped.");
  return 0;
}
