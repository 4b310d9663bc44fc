#include "ldid/random/random_bits.h"

#include "ldid/bits/bit_buffer.h"

#include <array>
#include <string>

namespace ldid::random {

core::Result<bool, core::IdError> validate_random_width(const int width) {
  if (width <= 0 || width > bits::kMaxFieldWidth) {
    return core::Result<bool, core::IdError>::err(
        {core::IdErrorCode::kInvalidWidth,
         "random width " + std::to_string(width) + " outside [1, 64]"});
  }
  return core::Result<bool, core::IdError>::ok(true);
}

core::Result<std::uint64_t, core::IdError> draw_random_bits(IEntropySource& source,
                                                            const int width) {
  const auto valid = validate_random_width(width);
  if (!valid.has_value()) {
    return core::Result<std::uint64_t, core::IdError>::err(valid.error());
  }

  std::array<std::uint8_t, 8> raw{};
  const auto filled = source.fill(raw);
  if (!filled.has_value()) {
    return core::Result<std::uint64_t, core::IdError>::err(filled.error());
  }

  std::uint64_t value = 0;
  for (const std::uint8_t b : raw) {
    value = (value << 8) | b;
  }
  return core::Result<std::uint64_t, core::IdError>::ok(value & bits::low_bits_mask(width));
}

}  // namespace ldid::random
