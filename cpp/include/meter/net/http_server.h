#pragma once

#include <atomic>
#include <cstdint>
#include <list>
#include <string>
#include <thread>

#include "meter/net/router.h"
#include "meter/status.h"

namespace meter::net {

struct HttpServerConfig final {
  const char* host = "0.0.0.0";
  std::uint16_t port = 3002;        // 0 = pick an ephemeral port
  std::uint32_t run_for_ms = 0;     // 0 = run forever
  std::uint32_t idle_timeout_ms = 5000;
  int max_connections = 64;
};

// HTTP/1.1 front end. The accept loop only accepts; each connection is served
// on its own thread, so a blocking sensor read stalls only that connection.
class HttpServer final {
 public:
  HttpServer(Router& router, HttpServerConfig cfg);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Binds and listens. port() is valid afterwards.
  Status listen();

  // Accept loop; returns after stop() or run_for_ms. Joins every connection
  // thread before returning.
  Status run_forever();

  // Async-signal-safe.
  void stop();

  bool listening() const { return listen_fd_ >= 0; }
  std::uint16_t port() const { return bound_port_; }

 private:
  struct Worker final {
    std::thread thread;
    std::atomic<bool> done{false};
  };

  void serve_connection(int fd);
  // Reads until a full request head is buffered. false: close the connection.
  bool read_request_head(int fd, std::string& buf, std::size_t& head_len);
  Status send_response(int fd, const HttpResponse& resp, bool keep_alive);
  // 503 and close, for clients that get no connection thread.
  void reject_connection(int fd);
  void reap_workers(bool wait_all);
  void close_listener();

  Router& router_;
  HttpServerConfig cfg_;
  int listen_fd_{-1};
  std::uint16_t bound_port_{0};
  std::atomic<bool> stop_requested_{false};
  std::list<Worker> workers_;
};

}  // namespace meter::net
