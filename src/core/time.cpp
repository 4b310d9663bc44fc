#include "ldid/core/time.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace ldid::core {

std::string format_unix_ms_iso8601(const std::uint64_t unix_ms) {
  const auto seconds = static_cast<std::time_t>(unix_ms / 1000);
  const auto millis = static_cast<unsigned>(unix_ms % 1000);

  // gmtime_r: the shared buffer behind std::gmtime is not safe across threads.
  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
      << millis << 'Z';
  return oss.str();
}

}  // namespace ldid::core
