#include "ldid/random/entropy_source.h"

#include <sys/random.h>

#include <cerrno>
#include <cstring>
#include <string>

namespace ldid::random {

core::Result<bool, core::IdError> SystemEntropySource::fill(const std::span<std::uint8_t> out) {
  std::size_t filled = 0;
  while (filled < out.size()) {
    const ssize_t n = getrandom(out.data() + filled, out.size() - filled, 0);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      const int saved = errno;
      return core::Result<bool, core::IdError>::err(
          {core::IdErrorCode::kRandomSource,
           std::string("getrandom failed: ") + std::strerror(saved)});
    }
    // Short reads are legal for requests above 256 bytes or after a signal.
    filled += static_cast<std::size_t>(n);
  }
  return core::Result<bool, core::IdError>::ok(true);
}

}  // namespace ldid::random
