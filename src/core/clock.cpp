#include "ldid/core/clock.h"

#include "ldid/core/time.h"

namespace ldid::core {

std::uint64_t SystemClock::now_unix_ms() {
  return to_unix_millis(Clock::now());
}

std::uint64_t FixedClock::now_unix_ms() {
  return fixed_ms_;
}

}  // namespace ldid::core
