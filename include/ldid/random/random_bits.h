#pragma once

#include "ldid/core/error.h"
#include "ldid/core/result.h"
#include "ldid/random/entropy_source.h"

#include <cstdint>

namespace ldid::random {

// validate_random_width rejects widths whose range [0, 2^width) cannot be held in a
// uint64_t or is empty. Width 64 is accepted and yields the full uint64_t range.
[[nodiscard]] core::Result<bool, core::IdError> validate_random_width(int width);

// draw_random_bits returns a uniformly distributed integer in [0, 2^width).
//
// Reads exactly 8 bytes from source, interprets them big-endian, and keeps the low
// `width` bits. The bound is a power of two, so masking a uniform 64-bit draw is itself
// uniform; no rejection loop is needed.
//
// Errors:
// - kInvalidWidth when width <= 0 or width > 64 (source is not touched)
// - kRandomSource propagated unchanged from source.fill()
[[nodiscard]] core::Result<std::uint64_t, core::IdError> draw_random_bits(IEntropySource& source,
                                                                         int width);

}  // namespace ldid::random
