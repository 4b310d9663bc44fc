#include "ldid/bits/bit_buffer.h"

#include <algorithm>
#include <string>

namespace ldid::bits {

namespace {

// Shared bounds check for insert/extract.
core::Result<bool, core::IdError> check_field(const std::size_t offset, const int width) {
  if (width < 1 || width > kMaxFieldWidth) {
    return core::Result<bool, core::IdError>::err(
        {core::IdErrorCode::kInvalidWidth,
         "field width " + std::to_string(width) + " outside [1, 64]"});
  }
  const auto w = static_cast<std::size_t>(width);
  if (offset > BitBuffer::kBitWidth || w > BitBuffer::kBitWidth - offset) {
    return core::Result<bool, core::IdError>::err(
        {core::IdErrorCode::kRange, "field [" + std::to_string(offset) + ", " +
                                        std::to_string(offset + w) + ") exceeds " +
                                        std::to_string(BitBuffer::kBitWidth) + "-bit buffer"});
  }
  return core::Result<bool, core::IdError>::ok(true);
}

}  // namespace

core::Result<BitBuffer, core::IdError> BitBuffer::from_bytes(
    const std::span<const std::uint8_t> bytes) {
  if (bytes.size() != kByteLength) {
    return core::Result<BitBuffer, core::IdError>::err(
        {core::IdErrorCode::kFormat, "expected " + std::to_string(kByteLength) +
                                         " bytes, got " + std::to_string(bytes.size())});
  }
  Bytes copy{};
  std::copy(bytes.begin(), bytes.end(), copy.begin());
  return core::Result<BitBuffer, core::IdError>::ok(BitBuffer(copy));
}

core::Result<bool, core::IdError> BitBuffer::insert(const std::size_t offset, const int width,
                                                    const std::uint64_t value,
                                                    const OverflowPolicy policy) {
  auto check = check_field(offset, width);
  if (!check.has_value()) {
    return check;
  }
  if (policy == OverflowPolicy::kReject && (value & ~low_bits_mask(width)) != 0) {
    return core::Result<bool, core::IdError>::err(
        {core::IdErrorCode::kRange,
         "value " + std::to_string(value) + " does not fit in " + std::to_string(width) +
             " bits"});
  }

  // Walk the field one byte-aligned chunk at a time, most significant bits first.
  std::size_t pos = offset;
  int remaining = width;
  while (remaining > 0) {
    const std::size_t index = pos / 8;
    const int room = 8 - static_cast<int>(pos % 8);
    const int take = std::min(room, remaining);
    const int shift = room - take;

    const auto chunk_mask = static_cast<unsigned>(low_bits_mask(take));
    const auto chunk = static_cast<unsigned>(value >> (remaining - take)) & chunk_mask;
    const auto byte_mask = static_cast<std::uint8_t>(chunk_mask << shift);

    bytes_[index] = static_cast<std::uint8_t>((bytes_[index] & ~byte_mask) | (chunk << shift));

    pos += static_cast<std::size_t>(take);
    remaining -= take;
  }
  return core::Result<bool, core::IdError>::ok(true);
}

core::Result<std::uint64_t, core::IdError> BitBuffer::extract(const std::size_t offset,
                                                              const int width) const {
  auto check = check_field(offset, width);
  if (!check.has_value()) {
    return core::Result<std::uint64_t, core::IdError>::err(check.error());
  }

  std::uint64_t out = 0;
  std::size_t pos = offset;
  int remaining = width;
  while (remaining > 0) {
    const std::size_t index = pos / 8;
    const int room = 8 - static_cast<int>(pos % 8);
    const int take = std::min(room, remaining);
    const int shift = room - take;

    const auto chunk = (static_cast<unsigned>(bytes_[index]) >> shift) &
                       static_cast<unsigned>(low_bits_mask(take));
    out = (out << take) | chunk;

    pos += static_cast<std::size_t>(take);
    remaining -= take;
  }
  return core::Result<std::uint64_t, core::IdError>::ok(out);
}

}  // namespace ldid::bits
