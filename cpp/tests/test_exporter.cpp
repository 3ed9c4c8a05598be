#include "minitest.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "fake_sensor.h"
#include "meter/exporter.h"

using meter::Exporter;
using meter::StatusCode;
using meter::tests::ScriptedSensor;
using meter::tests::SensorStats;

namespace {

meter::net::HttpServerConfig loopback_config() {
  meter::net::HttpServerConfig cfg{};
  cfg.host = "127.0.0.1";
  cfg.port = 0;
  cfg.idle_timeout_ms = 2000;
  return cfg;
}

// Sends `raw` and reads until the server closes. Empty string on socket errors.
std::string http_exchange(std::uint16_t port, const std::string& raw) {
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) return {};

  timeval tv{};
  tv.tv_sec = 5;
  (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    ::close(fd);
    return {};
  }

  std::size_t sent = 0;
  while (sent < raw.size()) {
    const ssize_t w = ::send(fd, raw.data() + sent, raw.size() - sent, MSG_NOSIGNAL);
    if (w <= 0) break;
    sent += static_cast<std::size_t>(w);
  }

  std::string out;
  char buf[1024];
  while (true) {
    const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    if (n <= 0) break;
    out.append(buf, static_cast<std::size_t>(n));
  }
  ::close(fd);
  return out;
}

std::string get(std::uint16_t port, const char* path) {
  return http_exchange(port, std::string("GET ") + path + " HTTP/1.1\r\nHost: test\r\nConnection: close\r\n\r\n");
}

int connect_loopback(std::uint16_t port) {
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) return -1;
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    ::close(fd);
    return -1;
  }
  return fd;
}

bool starts_with(const std::string& s, const char* prefix) { return s.rfind(prefix, 0) == 0; }

// Runs the exporter on a background thread for the lifetime of the object.
class RunningExporter final {
 public:
  explicit RunningExporter(Exporter& e) : e_(e), th_([this] { result_ = e_.run(); }) {}
  ~RunningExporter() { finish(); }

  meter::Status finish() {
    if (th_.joinable()) {
      e_.stop();
      th_.join();
    }
    return result_;
  }

 private:
  Exporter& e_;
  meter::Status result_{meter::Status::Ok()};
  std::thread th_;
};

}  // namespace

METER_TEST_CASE("exporter does not listen when sensor init fails") {
  auto stats = std::make_shared<SensorStats>();
  auto drv = std::make_unique<ScriptedSensor>(stats);
  drv->fail_init = true;

  Exporter exporter(std::move(drv), loopback_config());
  const meter::Status st = exporter.start();
  REQUIRE(st.code == StatusCode::kInitFailed);
  REQUIRE_FALSE(exporter.serving());
  REQUIRE(exporter.port() == 0);
  REQUIRE(exporter.registry().size() == 0);
  REQUIRE(exporter.run().code == StatusCode::kInternal);
  REQUIRE(stats->init_calls == 1);
}

METER_TEST_CASE("exporter serves /metrics, 404 and 503 over http") {
  auto stats = std::make_shared<SensorStats>();
  auto drv = std::make_unique<ScriptedSensor>(stats);
  ScriptedSensor* sensor = drv.get();
  sensor->push(meter::tests::reading(21.5, 101325.0, 45.0));

  Exporter exporter(std::move(drv), loopback_config());
  REQUIRE(exporter.start().ok());
  REQUIRE(exporter.serving());
  REQUIRE(exporter.port() != 0);
  RunningExporter running(exporter);

  const std::string ok = get(exporter.port(), "/metrics");
  REQUIRE(starts_with(ok, "HTTP/1.1 200 OK\r\n"));
  REQUIRE(ok.find("Content-Type: text/plain; version=0.0.4") != std::string::npos);
  REQUIRE(ok.find("\nmeter_temperature_celsius 21.5\n") != std::string::npos);
  REQUIRE(ok.find("\nmeter_pressure_pascals 101325\n") != std::string::npos);
  REQUIRE(ok.find("\nmeter_humidity_percent 45\n") != std::string::npos);

  const std::string missing = get(exporter.port(), "/");
  REQUIRE(starts_with(missing, "HTTP/1.1 404 Not Found\r\n"));
  REQUIRE(missing.find("Content-Length: 0\r\n") != std::string::npos);
  REQUIRE(missing.size() == missing.find("\r\n\r\n") + 4);

  sensor->fail_next_reads(1);
  const std::string failed = get(exporter.port(), "/metrics");
  REQUIRE(starts_with(failed, "HTTP/1.1 503 "));
  REQUIRE(failed.find("meter_temperature_celsius") == std::string::npos);

  REQUIRE(running.finish().ok());
  REQUIRE_FALSE(exporter.serving());
}

METER_TEST_CASE("exporter answers pipelined keep-alive requests in order") {
  auto stats = std::make_shared<SensorStats>();
  auto drv = std::make_unique<ScriptedSensor>(stats);
  drv->push(meter::tests::reading(20.0, 100000.0, 40.0));
  drv->push(meter::tests::reading(30.0, 100100.0, 50.0));

  Exporter exporter(std::move(drv), loopback_config());
  REQUIRE(exporter.start().ok());
  RunningExporter running(exporter);

  const std::string out = http_exchange(exporter.port(),
                                        "GET /metrics HTTP/1.1\r\nHost: t\r\n\r\n"
                                        "GET /missing HTTP/1.1\r\nHost: t\r\n\r\n"
                                        "GET /metrics HTTP/1.1\r\nHost: t\r\nConnection: close\r\n\r\n");
  const std::size_t first = out.find("meter_temperature_celsius 20\n");
  const std::size_t not_found = out.find("HTTP/1.1 404 Not Found");
  const std::size_t second = out.find("meter_temperature_celsius 30\n");
  REQUIRE(first != std::string::npos);
  REQUIRE(not_found != std::string::npos);
  REQUIRE(second != std::string::npos);
  REQUIRE(first < not_found);
  REQUIRE(not_found < second);
  REQUIRE(stats->measure_calls == 2);
}

METER_TEST_CASE("concurrent scrapes over http serialize sensor access") {
  auto stats = std::make_shared<SensorStats>();
  auto drv = std::make_unique<ScriptedSensor>(stats);
  drv->read_delay = std::chrono::milliseconds(5);
  drv->push(meter::tests::reading(21.5, 101325.0, 45.0));

  Exporter exporter(std::move(drv), loopback_config());
  REQUIRE(exporter.start().ok());
  RunningExporter running(exporter);

  constexpr int kClients = 6;
  constexpr int kScrapes = 3;
  std::vector<int> ok_counts(kClients, 0);
  std::vector<std::thread> clients;
  const std::uint16_t port = exporter.port();
  for (int c = 0; c < kClients; ++c) {
    clients.emplace_back([port, c, &ok_counts] {
      for (int i = 0; i < kScrapes; ++i) {
        if (starts_with(get(port, "/metrics"), "HTTP/1.1 200 OK\r\n")) ++ok_counts[c];
      }
    });
  }
  for (auto& th : clients) th.join();

  for (int n : ok_counts) REQUIRE(n == kScrapes);
  REQUIRE(stats->measure_calls == kClients * kScrapes);
  REQUIRE(stats->max_in_flight == 1);
}

METER_TEST_CASE("exporter stops on its own after run_for_ms") {
  auto stats = std::make_shared<SensorStats>();
  meter::net::HttpServerConfig cfg = loopback_config();
  cfg.run_for_ms = 300;

  Exporter exporter(std::make_unique<ScriptedSensor>(stats), cfg);
  REQUIRE(exporter.start().ok());
  const auto t0 = std::chrono::steady_clock::now();
  REQUIRE(exporter.run().ok());
  REQUIRE(std::chrono::steady_clock::now() - t0 >= std::chrono::milliseconds(300));
  REQUIRE_FALSE(exporter.serving());
}

METER_TEST_CASE("client beyond the connection limit gets 503 and the server keeps serving") {
  auto stats = std::make_shared<SensorStats>();
  auto drv = std::make_unique<ScriptedSensor>(stats);
  drv->push(meter::tests::reading(21.5, 101325.0, 45.0));
  meter::net::HttpServerConfig cfg = loopback_config();
  cfg.max_connections = 1;

  Exporter exporter(std::move(drv), cfg);
  REQUIRE(exporter.start().ok());
  RunningExporter running(exporter);

  // Idle keep-alive client holds the only connection slot.
  const int holder = connect_loopback(exporter.port());
  REQUIRE(holder >= 0);

  const std::string rejected = get(exporter.port(), "/metrics");
  REQUIRE(starts_with(rejected, "HTTP/1.1 503 "));
  REQUIRE(rejected.find("Connection: close\r\n") != std::string::npos);
  REQUIRE(rejected.find("meter_temperature_celsius") == std::string::npos);
  REQUIRE(stats->measure_calls == 0);

  ::close(holder);
  bool served = false;
  for (int attempt = 0; attempt < 40 && !served; ++attempt) {
    served = starts_with(get(exporter.port(), "/metrics"), "HTTP/1.1 200 OK\r\n");
    if (!served) std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  REQUIRE(served);
  REQUIRE(running.finish().ok());
}
