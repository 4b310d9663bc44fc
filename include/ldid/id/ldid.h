#pragma once

#include "ldid/bits/bit_buffer.h"
#include "ldid/core/error.h"
#include "ldid/core/result.h"
#include "ldid/id/generator.h"

#include <compare>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace ldid::id {

// Ldid is an immutable 128-bit identifier: a 48-bit millisecond timestamp, a version tag
// (7), 12 random bits, a variant tag (0b10), and 62 random bits. See layout.h.
//
// Its text form is the UUID-shaped "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx" in lower-case hex.
// Uniqueness is probabilistic: there is no node id, clock-skew handling, or sequence counter.
//
// Ldid values are only obtainable through the factories below, so a held Ldid is always
// fully built. Equality and ordering compare the 16 raw bytes; since the timestamp leads,
// ordering follows creation millisecond.
class Ldid {
 public:
  // Build from generator inputs. The timestamp is truncated to 48 bits and each random
  // draw to its field width. Any generator error aborts construction and is returned as-is.
  [[nodiscard]] static core::Result<Ldid, core::IdError> create(IGenerator& generator);

  // Build with a SystemGenerator (wall clock + kernel CSPRNG).
  [[nodiscard]] static core::Result<Ldid, core::IdError> generate();

  // Wrap exactly 16 raw bytes (the binary wire form). No field validation is applied.
  [[nodiscard]] static core::Result<Ldid, core::IdError> from_bytes(
      std::span<const std::uint8_t> bytes);

  // Parse canonical text. All '-' characters are removed; the remainder must be exactly
  // 32 hex digits (either case), otherwise kFormat.
  [[nodiscard]] static core::Result<Ldid, core::IdError> from_string(std::string_view text);

  // Field accessors. kRange is impossible for a constructed Ldid.
  [[nodiscard]] core::Result<std::uint64_t, core::IdError> timestamp() const;
  [[nodiscard]] core::Result<std::uint64_t, core::IdError> version() const;
  [[nodiscard]] core::Result<std::uint64_t, core::IdError> rand_a() const;
  [[nodiscard]] core::Result<std::uint64_t, core::IdError> variant() const;
  [[nodiscard]] core::Result<std::uint64_t, core::IdError> rand_b() const;

  // 8-4-4-4-12 lower-case hex.
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] const bits::BitBuffer::Bytes& bytes() const { return buffer_.bytes(); }

  auto operator<=>(const Ldid&) const = default;

 private:
  explicit Ldid(const bits::BitBuffer& buffer) : buffer_(buffer) {}

  bits::BitBuffer buffer_;
};

}  // namespace ldid::id
