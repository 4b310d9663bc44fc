#pragma once

#include "ldid/core/error.h"
#include "ldid/core/result.h"

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <span>

namespace ldid::bits {

// Widest field a single insert/extract can address: the result must fit in uint64_t.
inline constexpr int kMaxFieldWidth = 64;

// low_bits_mask returns a value with the low `width` bits set.
// Precondition: 1 <= width <= 64.
constexpr std::uint64_t low_bits_mask(const int width) noexcept {
  return width >= kMaxFieldWidth ? ~std::uint64_t{0} : (std::uint64_t{1} << width) - 1u;
}

// OverflowPolicy decides what insert() does with a value wider than its field.
// kReject: fail with kRange (default; catches caller bugs)
// kTruncate: keep the low `width` bits, i.e. store value mod 2^width
enum class OverflowPolicy {
  kReject,    // NOLINT(readability-identifier-naming)
  kTruncate,  // NOLINT(readability-identifier-naming)
};

// BitBuffer is a fixed 128-bit container addressed in big-endian bit order:
// bit 0 is the most significant bit of bytes()[0], bit 127 the least significant bit of
// bytes()[15].
//
// Fields are unsigned integers of 1..64 bits placed at arbitrary bit offsets. Fields may
// straddle byte boundaries. All operations are allocation-free shift-and-mask over the
// backing array.
//
// Error mapping:
// - width outside [1, 64]                      -> kInvalidWidth
// - offset + width > kBitWidth                 -> kRange
// - value wider than width under kReject       -> kRange
// - from_bytes() with length != kByteLength    -> kFormat
class BitBuffer {
 public:
  static constexpr std::size_t kBitWidth = 128;
  static constexpr std::size_t kByteLength = kBitWidth / 8;
  using Bytes = std::array<std::uint8_t, kByteLength>;

  // All bits zero.
  BitBuffer() = default;
  explicit BitBuffer(const Bytes& bytes) : bytes_(bytes) {}

  // Copy an externally supplied byte sequence. Length must be exactly kByteLength.
  [[nodiscard]] static core::Result<BitBuffer, core::IdError> from_bytes(
      std::span<const std::uint8_t> bytes);

  // Write the low `width` bits of value into bit positions [offset, offset + width).
  // Bits outside that range are left untouched. On failure the buffer is unchanged.
  [[nodiscard]] core::Result<bool, core::IdError> insert(
      std::size_t offset, int width, std::uint64_t value,
      OverflowPolicy policy = OverflowPolicy::kReject);

  // Read bit positions [offset, offset + width) right-aligned into a uint64_t.
  [[nodiscard]] core::Result<std::uint64_t, core::IdError> extract(std::size_t offset,
                                                                  int width) const;

  [[nodiscard]] const Bytes& bytes() const { return bytes_; }

  auto operator<=>(const BitBuffer&) const = default;

 private:
  Bytes bytes_{};
};

}  // namespace ldid::bits
