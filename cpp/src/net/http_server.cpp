#include "meter/net/http_server.h"

#include <arpa/inet.h>
#include <cerrno>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <string_view>
#include <system_error>

#include "meter/net/http.h"
#include "meter/util/log.h"
#include "meter/util/time.h"

namespace meter::net {

namespace {

constexpr int kPollIntervalMs = 250;
constexpr std::size_t kReadChunk = 1024;

static bool set_nonblocking(int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

static Status write_all(int fd, std::string_view data) {
  while (!data.empty()) {
    const ssize_t w = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
    if (w < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        pollfd p{fd, POLLOUT, 0};
        if (::poll(&p, 1, 1000) <= 0) return Status::IoError("write timed out");
        continue;
      }
      return Status::IoError("send() failed", errno);
    }
    data.remove_prefix(static_cast<std::size_t>(w));
  }
  return Status::Ok();
}

}  // namespace

HttpServer::HttpServer(Router& router, HttpServerConfig cfg) : router_(router), cfg_(cfg) {}

HttpServer::~HttpServer() {
  stop();
  reap_workers(true);
  close_listener();
}

Status HttpServer::listen() {
  if (listen_fd_ >= 0) return Status::Ok();

  const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) return Status::IoError("socket() failed", errno);

  int yes = 1;
  (void)::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(cfg_.port);
  if (::inet_pton(AF_INET, cfg_.host, &addr.sin_addr) != 1) {
    ::close(fd);
    return Status::InvalidArgument("invalid host");
  }

  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    const int err = errno;
    ::close(fd);
    return Status::IoError("bind() failed", err);
  }

  if (::listen(fd, 16) != 0) {
    const int err = errno;
    ::close(fd);
    return Status::IoError("listen() failed", err);
  }

  if (!set_nonblocking(fd)) {
    const int err = errno;
    ::close(fd);
    return Status::IoError("set_nonblocking(listen_fd) failed", err);
  }

  sockaddr_in bound{};
  socklen_t blen = sizeof(bound);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &blen) != 0) {
    const int err = errno;
    ::close(fd);
    return Status::IoError("getsockname() failed", err);
  }

  listen_fd_ = fd;
  bound_port_ = ntohs(bound.sin_port);
  return Status::Ok();
}

void HttpServer::stop() { stop_requested_.store(true, std::memory_order_relaxed); }

void HttpServer::close_listener() {
  if (listen_fd_ >= 0) ::close(listen_fd_);
  listen_fd_ = -1;
}

Status HttpServer::run_forever() {
  if (listen_fd_ < 0) return Status::Internal("listen() not called");

  const std::uint64_t start_ms = meter::util::monotonic_ms();
  Status result = Status::Ok();

  while (!stop_requested_.load(std::memory_order_relaxed)) {
    if (cfg_.run_for_ms != 0 && meter::util::monotonic_ms() - start_ms >= cfg_.run_for_ms) break;

    reap_workers(false);

    pollfd p{listen_fd_, POLLIN, 0};
    const int rc = ::poll(&p, 1, kPollIntervalMs);
    if (rc < 0) {
      if (errno == EINTR) continue;
      result = Status::IoError("poll() failed", errno);
      break;
    }
    if (rc == 0 || !(p.revents & POLLIN)) continue;

    // Accept as many as possible.
    while (true) {
      sockaddr_in caddr{};
      socklen_t clen = sizeof(caddr);
      const int cfd = ::accept4(listen_fd_, reinterpret_cast<sockaddr*>(&caddr), &clen, SOCK_CLOEXEC);
      if (cfd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
          meter::util::log(meter::util::LogLevel::kDebug, "accept() failed: errno=%d", errno);
        }
        break;
      }

      if (static_cast<int>(workers_.size()) >= cfg_.max_connections) {
        meter::util::log(meter::util::LogLevel::kWarn, "connection limit (%d) reached, rejecting client",
                         cfg_.max_connections);
        reject_connection(cfd);
        continue;
      }

      workers_.emplace_back();
      Worker& w = workers_.back();
      try {
        w.thread = std::thread([this, cfd, &w] {
          serve_connection(cfd);
          w.done.store(true, std::memory_order_release);
        });
      } catch (const std::system_error& e) {
        workers_.pop_back();
        meter::util::log(meter::util::LogLevel::kError, "cannot start connection thread: %s", e.what());
        reject_connection(cfd);
      }
    }
  }

  stop_requested_.store(true, std::memory_order_relaxed);
  close_listener();
  reap_workers(true);
  return result;
}

void HttpServer::reject_connection(int fd) {
  (void)write_all(fd, serialize_response(HttpResponse{503, nullptr, {}}, false));
  ::close(fd);
}

void HttpServer::reap_workers(bool wait_all) {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (wait_all || it->done.load(std::memory_order_acquire)) {
      if (it->thread.joinable()) it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

bool HttpServer::read_request_head(int fd, std::string& buf, std::size_t& head_len) {
  const std::uint64_t idle_start = meter::util::monotonic_ms();
  char chunk[kReadChunk];

  while (true) {
    const std::size_t end = buf.find("\r\n\r\n");
    if (end != std::string::npos) {
      if (end > kMaxRequestHeadBytes) break;
      head_len = end;
      return true;
    }
    if (buf.size() > kMaxRequestHeadBytes) break;

    if (stop_requested_.load(std::memory_order_relaxed)) return false;
    if (meter::util::monotonic_ms() - idle_start >= cfg_.idle_timeout_ms) return false;

    pollfd p{fd, POLLIN, 0};
    const int rc = ::poll(&p, 1, kPollIntervalMs);
    if (rc < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (rc == 0) continue;
    if (p.revents & (POLLERR | POLLNVAL)) return false;

    const ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
      return false;
    }
    if (n == 0) return false;
    buf.append(chunk, static_cast<std::size_t>(n));
  }

  (void)send_response(fd, HttpResponse{431, nullptr, {}}, false);
  return false;
}

Status HttpServer::send_response(int fd, const HttpResponse& resp, bool keep_alive) {
  return write_all(fd, serialize_response(resp, keep_alive));
}

void HttpServer::serve_connection(int fd) {
  std::string buf;

  while (true) {
    std::size_t head_len = 0;
    if (!read_request_head(fd, buf, head_len)) break;

    const ParsedRequest req = parse_request_head(std::string_view(buf.data(), head_len));
    if (!req.ok) {
      meter::util::log(meter::util::LogLevel::kDebug, "bad request: %s", req.error ? req.error : "(none)");
      (void)send_response(fd, HttpResponse{400, nullptr, {}}, false);
      break;
    }

    // Request bodies are never read, so the connection cannot be reused after one.
    const bool keep_alive = req.keep_alive && !req.has_body && !stop_requested_.load(std::memory_order_relaxed);
    const HttpResponse resp = router_.handle(req.method, req.path);

    const Status st = send_response(fd, resp, keep_alive);
    if (!st.ok()) {
      // Client went away mid-scrape; the reading itself already completed.
      meter::util::log_status(meter::util::LogLevel::kDebug, "write response failed", st);
      break;
    }
    if (!keep_alive) break;

    buf.erase(0, head_len + 4);
  }

  ::close(fd);
}

}  // namespace meter::net
