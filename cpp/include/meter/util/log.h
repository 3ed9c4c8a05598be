#pragma once

#include <cstdint>
#include <string_view>

#include "meter/status.h"

namespace meter::util {

enum class LogLevel : std::uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

void set_log_level(LogLevel level);
LogLevel log_level();

// Accepts "debug", "info", "warn", "error".
bool parse_log_level(std::string_view s, LogLevel& out);

// printf-style; one line on stderr, newline appended.
void log(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

// Logs "<what>: <status message> (<code>[, <strerror>])".
void log_status(LogLevel level, const char* what, const Status& st);

}  // namespace meter::util
