#include "ldid/id/ldid.h"

#include "ldid/id/layout.h"

#include <array>
#include <iomanip>
#include <sstream>
#include <string>

namespace ldid::id {

namespace {

using LdidResult = core::Result<Ldid, core::IdError>;
using FieldResult = core::Result<std::uint64_t, core::IdError>;

// Hyphens precede these byte indices in canonical text.
constexpr std::array<std::size_t, 4> kGroupBreaks = {4, 6, 8, 10};
constexpr std::size_t kHexDigits = bits::BitBuffer::kByteLength * 2;

int hex_value(const char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

core::Result<bool, core::IdError> put(bits::BitBuffer& buffer, const FieldLayout& field,
                                      const std::uint64_t value) {
  return buffer.insert(field.offset, field.width, value, bits::OverflowPolicy::kTruncate);
}

}  // namespace

LdidResult Ldid::create(IGenerator& generator) {
  bits::BitBuffer buffer;

  auto status = put(buffer, layout::kTimestamp, generator.now_ms());
  if (!status.has_value()) {
    return LdidResult::err(status.error());
  }

  status = put(buffer, layout::kVersion, layout::kVersionTag);
  if (!status.has_value()) {
    return LdidResult::err(status.error());
  }

  const auto rand_a = generator.random_bits(layout::kRandA.width);
  if (!rand_a.has_value()) {
    return LdidResult::err(rand_a.error());
  }
  status = put(buffer, layout::kRandA, rand_a.value());
  if (!status.has_value()) {
    return LdidResult::err(status.error());
  }

  status = put(buffer, layout::kVariant, layout::kVariantTag);
  if (!status.has_value()) {
    return LdidResult::err(status.error());
  }

  const auto rand_b = generator.random_bits(layout::kRandB.width);
  if (!rand_b.has_value()) {
    return LdidResult::err(rand_b.error());
  }
  status = put(buffer, layout::kRandB, rand_b.value());
  if (!status.has_value()) {
    return LdidResult::err(status.error());
  }

  return LdidResult::ok(Ldid(buffer));
}

LdidResult Ldid::generate() {
  SystemGenerator generator;
  return create(generator);
}

LdidResult Ldid::from_bytes(const std::span<const std::uint8_t> bytes) {
  auto buffer = bits::BitBuffer::from_bytes(bytes);
  if (!buffer.has_value()) {
    return LdidResult::err(buffer.error());
  }
  return LdidResult::ok(Ldid(buffer.value()));
}

LdidResult Ldid::from_string(const std::string_view text) {
  std::string digits;
  digits.reserve(kHexDigits);
  for (const char c : text) {
    if (c != '-') {
      digits.push_back(c);
    }
  }

  if (digits.size() != kHexDigits) {
    return LdidResult::err({core::IdErrorCode::kFormat,
                            "expected 32 hex digits, got " + std::to_string(digits.size())});
  }

  bits::BitBuffer::Bytes bytes{};
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    const int hi = hex_value(digits[2 * i]);
    const int lo = hex_value(digits[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return LdidResult::err({core::IdErrorCode::kFormat,
                              "invalid hex digit in '" + std::string(text) + "'"});
    }
    bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return LdidResult::ok(Ldid(bits::BitBuffer(bytes)));
}

FieldResult Ldid::timestamp() const {
  return buffer_.extract(layout::kTimestamp.offset, layout::kTimestamp.width);
}

FieldResult Ldid::version() const {
  return buffer_.extract(layout::kVersion.offset, layout::kVersion.width);
}

FieldResult Ldid::rand_a() const {
  return buffer_.extract(layout::kRandA.offset, layout::kRandA.width);
}

FieldResult Ldid::variant() const {
  return buffer_.extract(layout::kVariant.offset, layout::kVariant.width);
}

FieldResult Ldid::rand_b() const {
  return buffer_.extract(layout::kRandB.offset, layout::kRandB.width);
}

std::string Ldid::to_string() const {
  const auto& raw = buffer_.bytes();
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  std::size_t next_break = 0;
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (next_break < kGroupBreaks.size() && i == kGroupBreaks[next_break]) {
      oss << '-';
      ++next_break;
    }
    oss << std::setw(2) << static_cast<unsigned>(raw[i]);
  }
  return oss.str();
}

}  // namespace ldid::id
