#include "minitest.h"
#include "meter/util/log.h"

int main() {
  // Scrape failures are exercised on purpose; keep the output readable.
  meter::util::set_log_level(meter::util::LogLevel::kError);
  return meter::tests::run_all();
}
