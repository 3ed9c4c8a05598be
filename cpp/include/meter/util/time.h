#pragma once

#include <cstdint>

namespace meter::util {

std::uint64_t unix_time_ms();

// Milliseconds from an arbitrary fixed point; never goes backwards.
std::uint64_t monotonic_ms();

}  // namespace meter::util
