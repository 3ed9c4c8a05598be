#include "meter/net/http.h"

namespace meter::net {

namespace {

static bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    char x = a[i];
    char y = b[i];
    if (x >= 'A' && x <= 'Z') x = static_cast<char>(x - 'A' + 'a');
    if (y >= 'A' && y <= 'Z') y = static_cast<char>(y - 'A' + 'a');
    if (x != y) return false;
  }
  return true;
}

static std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

// True if the comma-separated header value lists `token`.
static bool has_token(std::string_view value, std::string_view token) {
  while (!value.empty()) {
    const std::size_t comma = value.find(',');
    if (iequals(trim(value.substr(0, comma)), token)) return true;
    if (comma == std::string_view::npos) break;
    value.remove_prefix(comma + 1);
  }
  return false;
}

static ParsedRequest fail(const char* error) {
  ParsedRequest pr{};
  pr.ok = false;
  pr.keep_alive = false;
  pr.error = error;
  return pr;
}

}  // namespace

ParsedRequest parse_request_head(std::string_view head) {
  const std::size_t eol = head.find("\r\n");
  const std::string_view request_line = head.substr(0, eol);
  std::string_view fields = (eol == std::string_view::npos) ? std::string_view{} : head.substr(eol + 2);

  // METHOD SP request-target SP HTTP-version
  const std::size_t sp1 = request_line.find(' ');
  if (sp1 == std::string_view::npos || sp1 == 0) return fail("malformed request line");
  const std::size_t sp2 = request_line.find(' ', sp1 + 1);
  if (sp2 == std::string_view::npos || sp2 == sp1 + 1) return fail("malformed request line");
  if (request_line.find(' ', sp2 + 1) != std::string_view::npos) return fail("malformed request line");

  ParsedRequest pr{};
  pr.method = request_line.substr(0, sp1);
  const std::string_view target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
  pr.version = request_line.substr(sp2 + 1);

  if (pr.version == "HTTP/1.1") {
    pr.keep_alive = true;
  } else if (pr.version == "HTTP/1.0") {
    pr.keep_alive = false;
  } else {
    return fail("unsupported http version");
  }

  pr.path = target.substr(0, target.find('?'));
  if (pr.path.empty()) return fail("empty request target");

  while (!fields.empty()) {
    const std::size_t end = fields.find("\r\n");
    const std::string_view line = fields.substr(0, end);
    fields = (end == std::string_view::npos) ? std::string_view{} : fields.substr(end + 2);
    if (line.empty()) continue;

    const std::size_t colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) return fail("malformed header field");
    const std::string_view name = line.substr(0, colon);
    const std::string_view value = trim(line.substr(colon + 1));

    if (iequals(name, "Connection")) {
      if (has_token(value, "close")) pr.keep_alive = false;
      if (has_token(value, "keep-alive")) pr.keep_alive = true;
    } else if (iequals(name, "Content-Length")) {
      if (value.empty()) return fail("invalid content-length");
      for (char ch : value) {
        if (ch < '0' || ch > '9') return fail("invalid content-length");
        if (ch != '0') pr.has_body = true;
      }
    } else if (iequals(name, "Transfer-Encoding")) {
      pr.has_body = true;
    }
  }

  return pr;
}

const char* reason_phrase(int status) {
  switch (status) {
    case 200:
      return "OK";
    case 400:
      return "Bad Request";
    case 404:
      return "Not Found";
    case 431:
      return "Request Header Fields Too Large";
    case 500:
      return "Internal Server Error";
    case 503:
      return "Service Unavailable";
    default:
      return "Unknown";
  }
}

std::string serialize_response(const HttpResponse& resp, bool keep_alive) {
  std::string out;
  out.reserve(128 + resp.body.size());
  out += "HTTP/1.1 ";
  out += std::to_string(resp.status);
  out += ' ';
  out += reason_phrase(resp.status);
  out += "\r\n";
  if (resp.content_type) {
    out += "Content-Type: ";
    out += resp.content_type;
    out += "\r\n";
  }
  out += "Content-Length: ";
  out += std::to_string(resp.body.size());
  out += keep_alive ? "\r\nConnection: keep-alive\r\n\r\n" : "\r\nConnection: close\r\n\r\n";
  out += resp.body;
  return out;
}

}  // namespace meter::net
