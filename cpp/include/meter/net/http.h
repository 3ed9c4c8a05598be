#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace meter::net {

// Requests whose head exceeds this are answered with 431.
inline constexpr std::size_t kMaxRequestHeadBytes = 8192;

struct ParsedRequest final {
  std::string_view method;
  // Request-target up to (excluding) any '?'.
  std::string_view path;
  std::string_view version;
  bool keep_alive{true};
  bool has_body{false};
  bool ok{true};
  const char* error{nullptr};
};

// Parses a request head: request line and header fields, without the
// terminating empty line. Views point into `head`.
ParsedRequest parse_request_head(std::string_view head);

struct HttpResponse final {
  int status{200};
  // nullptr: no Content-Type header.
  const char* content_type{nullptr};
  std::string body;
};

const char* reason_phrase(int status);

std::string serialize_response(const HttpResponse& resp, bool keep_alive);

}  // namespace meter::net
