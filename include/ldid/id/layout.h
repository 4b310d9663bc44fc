#pragma once

#include "ldid/bits/bit_buffer.h"

#include <cstddef>
#include <cstdint>

namespace ldid::id {

// FieldLayout names one bit range inside the 128-bit LDID.
struct FieldLayout {
  std::size_t offset;  // NOLINT(readability-identifier-naming)
  int width;           // NOLINT(readability-identifier-naming)

  [[nodiscard]] constexpr std::size_t end() const {
    return offset + static_cast<std::size_t>(width);
  }
};

// Bit layout, big-endian bit order (bit 0 = MSB of byte 0):
//
//   0                   48   52          64 66                         128
//   |  unix_ts_ms (48)   |ver| rand_a (12) |var|       rand_b (62)        |
namespace layout {

inline constexpr FieldLayout kTimestamp{0, 48};
inline constexpr FieldLayout kVersion{48, 4};
inline constexpr FieldLayout kRandA{52, 12};
inline constexpr FieldLayout kVariant{64, 2};
inline constexpr FieldLayout kRandB{66, 62};

inline constexpr std::uint64_t kVersionTag = 0b0111;
inline constexpr std::uint64_t kVariantTag = 0b10;

static_assert(kTimestamp.offset == 0);
static_assert(kTimestamp.end() == kVersion.offset);
static_assert(kVersion.end() == kRandA.offset);
static_assert(kRandA.end() == kVariant.offset);
static_assert(kVariant.end() == kRandB.offset);
static_assert(kRandB.end() == bits::BitBuffer::kBitWidth);

}  // namespace layout

}  // namespace ldid::id
