#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace ldid::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline std::uint64_t to_unix_millis(const Timestamp ts) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch());
  return static_cast<std::uint64_t>(ms.count());
}

// format_unix_ms_iso8601 renders milliseconds since epoch as "YYYY-MM-DDTHH:MM:SS.mmmZ".
// Values past year 9999 are still rendered; the year field simply widens.
[[nodiscard]] std::string format_unix_ms_iso8601(std::uint64_t unix_ms);

}  // namespace ldid::core
