#include "meter/util/log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>

#include "meter/util/time.h"

namespace meter::util {

namespace {

std::atomic<LogLevel> g_level{LogLevel::kInfo};

const char* level_tag(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
  }
  return "?";
}

}  // namespace

void set_log_level(LogLevel level) { g_level.store(level, std::memory_order_relaxed); }

LogLevel log_level() { return g_level.load(std::memory_order_relaxed); }

bool parse_log_level(std::string_view s, LogLevel& out) {
  if (s == "debug") {
    out = LogLevel::kDebug;
  } else if (s == "info") {
    out = LogLevel::kInfo;
  } else if (s == "warn") {
    out = LogLevel::kWarn;
  } else if (s == "error") {
    out = LogLevel::kError;
  } else {
    return false;
  }
  return true;
}

void log(LogLevel level, const char* fmt, ...) {
  if (static_cast<std::uint8_t>(level) < static_cast<std::uint8_t>(log_level())) return;

  char line[1024];
  int n = std::snprintf(line, sizeof(line), "%llu %-5s ", static_cast<unsigned long long>(unix_time_ms()),
                        level_tag(level));
  if (n < 0) return;

  std::size_t len = static_cast<std::size_t>(n);
  if (len < sizeof(line)) {
    va_list ap;
    va_start(ap, fmt);
    const int m = std::vsnprintf(line + len, sizeof(line) - len, fmt, ap);
    va_end(ap);
    if (m > 0) len += static_cast<std::size_t>(m);
  }

  // Truncated lines keep their newline.
  if (len >= sizeof(line) - 1) len = sizeof(line) - 2;
  line[len] = '\n';
  line[len + 1] = '\0';
  std::fputs(line, stderr);
}

void log_status(LogLevel level, const char* what, const Status& st) {
  if (st.sys_errno != 0) {
    log(level, "%s: %s (%s, %s)", what, st.message ? st.message : "(none)", status_code_name(st.code),
        std::strerror(st.sys_errno));
  } else {
    log(level, "%s: %s (%s)", what, st.message ? st.message : "(none)", status_code_name(st.code));
  }
}

}  // namespace meter::util
