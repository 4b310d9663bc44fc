#include "ldid/bits/bit_buffer.h"
#include "ldid/id/layout.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <vector>

using ldid::bits::BitBuffer;
using ldid::bits::OverflowPolicy;
using ldid::core::IdErrorCode;

TEST_CASE("BitBuffer starts with all bits zero", "[bits]") {
  const BitBuffer buffer;
  for (const auto b : buffer.bytes()) {
    CHECK(b == 0);
  }
  const auto high = buffer.extract(0, 64);
  const auto low = buffer.extract(64, 64);
  REQUIRE(high.has_value());
  REQUIRE(low.has_value());
  CHECK(high.value() == 0);
  CHECK(low.value() == 0);
}

TEST_CASE("BitBuffer uses big-endian bit order", "[bits]") {
  SECTION("bit 0 is the most significant bit of the first byte") {
    BitBuffer buffer;
    REQUIRE(buffer.insert(0, 1, 1).has_value());
    CHECK(buffer.bytes()[0] == 0x80);
  }

  SECTION("bit 127 is the least significant bit of the last byte") {
    BitBuffer buffer;
    REQUIRE(buffer.insert(127, 1, 1).has_value());
    CHECK(buffer.bytes()[15] == 0x01);
  }

  SECTION("a field straddling a byte boundary splits across both bytes") {
    BitBuffer buffer;
    REQUIRE(buffer.insert(4, 8, 0xAB).has_value());
    CHECK(buffer.bytes()[0] == 0x0A);
    CHECK(buffer.bytes()[1] == 0xB0);
  }
}

TEST_CASE("BitBuffer extract returns what insert wrote at every LDID field", "[bits]") {
  namespace layout = ldid::id::layout;
  struct Case {
    ldid::id::FieldLayout field;
    std::uint64_t value;
  };
  const std::vector<Case> cases = {
      {layout::kTimestamp, 0x0123456789ABull},
      {layout::kVersion, 0b0111},
      {layout::kRandA, 0xABC},
      {layout::kVariant, 0b10},
      {layout::kRandB, 0x2EADBEEFCAFEF00Dull},
  };

  BitBuffer buffer;
  for (const auto& c : cases) {
    REQUIRE(buffer.insert(c.field.offset, c.field.width, c.value).has_value());
  }
  // Read back after all writes so neighbouring inserts must not have clobbered each other.
  for (const auto& c : cases) {
    const auto got = buffer.extract(c.field.offset, c.field.width);
    REQUIRE(got.has_value());
    CHECK(got.value() == c.value);
  }
}

TEST_CASE("BitBuffer handles a full 64-bit field", "[bits]") {
  BitBuffer buffer;
  const std::uint64_t all_ones = std::numeric_limits<std::uint64_t>::max();
  REQUIRE(buffer.insert(64, 64, all_ones).has_value());

  const auto low = buffer.extract(64, 64);
  REQUIRE(low.has_value());
  CHECK(low.value() == all_ones);

  const auto high = buffer.extract(0, 64);
  REQUIRE(high.has_value());
  CHECK(high.value() == 0);
}

TEST_CASE("BitBuffer insert leaves surrounding bits untouched", "[bits]") {
  BitBuffer::Bytes ones{};
  ones.fill(0xFF);
  BitBuffer buffer(ones);

  REQUIRE(buffer.insert(52, 12, 0).has_value());

  const auto before = buffer.extract(0, 52);
  const auto field = buffer.extract(52, 12);
  const auto after = buffer.extract(64, 64);
  REQUIRE(before.has_value());
  REQUIRE(field.has_value());
  REQUIRE(after.has_value());
  CHECK(before.value() == (std::uint64_t{1} << 52) - 1);
  CHECK(field.value() == 0);
  CHECK(after.value() == std::numeric_limits<std::uint64_t>::max());
}

TEST_CASE("BitBuffer overflow policy", "[bits]") {
  SECTION("kReject refuses a value wider than the field and leaves the buffer unchanged") {
    BitBuffer buffer;
    const auto result = buffer.insert(0, 4, 0x1F);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == IdErrorCode::kRange);
    CHECK(buffer == BitBuffer{});
  }

  SECTION("kTruncate stores the value modulo 2^width") {
    BitBuffer buffer;
    REQUIRE(buffer.insert(0, 48, 0xFFFFFFFFFFFFFFFFull, OverflowPolicy::kTruncate).has_value());
    const auto got = buffer.extract(0, 48);
    REQUIRE(got.has_value());
    CHECK(got.value() == 0xFFFFFFFFFFFFull);

    const auto next = buffer.extract(48, 16);
    REQUIRE(next.has_value());
    CHECK(next.value() == 0);
  }

  SECTION("a value that fits is accepted under kReject") {
    BitBuffer buffer;
    CHECK(buffer.insert(0, 4, 0xF).has_value());
  }
}

TEST_CASE("BitBuffer rejects widths outside [1, 64]", "[bits]") {
  BitBuffer buffer;
  for (const int width : {0, -1, 65, 128}) {
    const auto ins = buffer.insert(0, width, 0);
    REQUIRE_FALSE(ins.has_value());
    CHECK(ins.error().code == IdErrorCode::kInvalidWidth);

    const auto ext = buffer.extract(0, width);
    REQUIRE_FALSE(ext.has_value());
    CHECK(ext.error().code == IdErrorCode::kInvalidWidth);
  }
}

TEST_CASE("BitBuffer rejects fields that run past bit 128", "[bits]") {
  BitBuffer buffer;

  SECTION("one bit too far") {
    const auto ins = buffer.insert(66, 63, 0);
    REQUIRE_FALSE(ins.has_value());
    CHECK(ins.error().code == IdErrorCode::kRange);
  }

  SECTION("offset at the end") {
    const auto ext = buffer.extract(128, 1);
    REQUIRE_FALSE(ext.has_value());
    CHECK(ext.error().code == IdErrorCode::kRange);
  }

  SECTION("huge offset does not wrap around") {
    const auto ext = buffer.extract(std::numeric_limits<std::size_t>::max(), 8);
    REQUIRE_FALSE(ext.has_value());
    CHECK(ext.error().code == IdErrorCode::kRange);
  }

  SECTION("last valid field") {
    CHECK(buffer.insert(127, 1, 1).has_value());
    CHECK(buffer.extract(64, 64).has_value());
  }
}

TEST_CASE("BitBuffer::from_bytes", "[bits]") {
  SECTION("exact length copies bytes verbatim") {
    std::vector<std::uint8_t> raw(16);
    for (std::size_t i = 0; i < raw.size(); ++i) {
      raw[i] = static_cast<std::uint8_t>(i * 17);
    }
    const auto buffer = BitBuffer::from_bytes(raw);
    REQUIRE(buffer.has_value());
    for (std::size_t i = 0; i < raw.size(); ++i) {
      CHECK(buffer.value().bytes()[i] == raw[i]);
    }
  }

  SECTION("wrong length is a format error") {
    const std::vector<std::uint8_t> short_input(15);
    const std::vector<std::uint8_t> long_input(17);
    const auto a = BitBuffer::from_bytes(short_input);
    const auto b = BitBuffer::from_bytes(long_input);
    REQUIRE_FALSE(a.has_value());
    REQUIRE_FALSE(b.has_value());
    CHECK(a.error().code == IdErrorCode::kFormat);
    CHECK(b.error().code == IdErrorCode::kFormat);
  }
}
