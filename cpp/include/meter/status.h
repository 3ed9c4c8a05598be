#pragma once

#include <cstdint>

namespace meter {

enum class StatusCode : std::uint8_t {
  kOk = 0,
  kInvalidArgument = 1,
  kIoError = 2,
  kInitFailed = 3,
  kSensorFault = 4,
  kEncodingFailed = 5,
  kInternal = 6,
};

const char* status_code_name(StatusCode code);

struct Status final {
  StatusCode code{StatusCode::kOk};
  const char* message{nullptr};
  // errno of the failing system call, 0 when the failure is not OS-level.
  int sys_errno{0};

  constexpr bool ok() const { return code == StatusCode::kOk; }

  static constexpr Status Ok() { return Status{StatusCode::kOk, nullptr, 0}; }
  static constexpr Status InvalidArgument(const char* msg) { return Status{StatusCode::kInvalidArgument, msg, 0}; }
  static constexpr Status IoError(const char* msg, int err = 0) { return Status{StatusCode::kIoError, msg, err}; }
  static constexpr Status InitFailed(const char* msg, int err = 0) { return Status{StatusCode::kInitFailed, msg, err}; }
  static constexpr Status SensorFault(const char* msg, int err = 0) { return Status{StatusCode::kSensorFault, msg, err}; }
  static constexpr Status EncodingFailed(const char* msg) { return Status{StatusCode::kEncodingFailed, msg, 0}; }
  static constexpr Status Internal(const char* msg) { return Status{StatusCode::kInternal, msg, 0}; }

  // Same cause, reclassified under a new code.
  constexpr Status as(StatusCode new_code) const { return Status{new_code, message, sys_errno}; }
};

}  // namespace meter
