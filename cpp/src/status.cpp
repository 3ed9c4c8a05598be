#include "meter/status.h"

namespace meter {

const char* status_code_name(StatusCode code) {
  switch (code) {
    case StatusCode::kOk:
      return "ok";
    case StatusCode::kInvalidArgument:
      return "invalid_argument";
    case StatusCode::kIoError:
      return "io_error";
    case StatusCode::kInitFailed:
      return "init_failed";
    case StatusCode::kSensorFault:
      return "sensor_fault";
    case StatusCode::kEncodingFailed:
      return "encoding_failed";
    case StatusCode::kInternal:
      return "internal";
  }
  return "unknown";
}

}  // namespace meter
