#include "ldid/id/generator.h"
#include "ldid/id/layout.h"
#include "ldid/id/ldid.h"

#include "mocks/mock_generator.h"
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <vector>

using ldid::core::IdErrorCode;
using ldid::id::FixedGenerator;
using ldid::id::Ldid;
using ldid::testing::MockGenerator;
using ldid::testing::random_failure;
using ldid::testing::random_ok;

TEST_CASE("Ldid::create truncates the timestamp to 48 bits", "[ldid]") {
  MockGenerator gen;
  gen.now_ms_fn = [] { return 0xFFFFFFFFFFFFFFFFull; };

  const auto result = Ldid::create(gen);
  REQUIRE(result.has_value());

  const auto ts = result.value().timestamp();
  REQUIRE(ts.has_value());
  CHECK(ts.value() == 0xFFFFFFFFFFFFull);

  // Truncation must not spill into the version tag.
  CHECK(result.value().version().value() == 0b0111);
}

TEST_CASE("Ldid::create always writes version 7 and variant 0b10", "[ldid]") {
  SECTION("system generator") {
    const auto result = Ldid::generate();
    REQUIRE(result.has_value());
    CHECK(result.value().version().value() == 0b0111);
    CHECK(result.value().variant().value() == 0b10);
  }

  SECTION("all-ones generator inputs") {
    FixedGenerator gen(0xFFFFFFFFFFFFFFFFull, 0xFFFFFFFFFFFFFFFFull);
    const auto result = Ldid::create(gen);
    REQUIRE(result.has_value());
    CHECK(result.value().version().value() == 0b0111);
    CHECK(result.value().variant().value() == 0b10);
  }

  SECTION("all-zero generator inputs") {
    FixedGenerator gen(0, 0);
    const auto result = Ldid::create(gen);
    REQUIRE(result.has_value());
    CHECK(result.value().version().value() == 0b0111);
    CHECK(result.value().variant().value() == 0b10);
  }
}

TEST_CASE("Ldid::create truncates each random draw to its field width", "[ldid]") {
  MockGenerator gen;
  gen.random_bits_fn = [](int) {
    return random_ok(0b1111000011110000111100001111000011110000111100001111000011110000ull);
  };

  const auto result = Ldid::create(gen);
  REQUIRE(result.has_value());

  const auto rand_a = result.value().rand_a();
  const auto rand_b = result.value().rand_b();
  REQUIRE(rand_a.has_value());
  REQUIRE(rand_b.has_value());
  CHECK(rand_a.value() == 0b000011110000ull);
  CHECK(rand_b.value() == 0b11000011110000111100001111000011110000111100001111000011110000ull);

  // 12-bit draw first, then the 62-bit draw.
  CHECK(gen.requested_widths == (std::vector<int>{12, 62}));
}

TEST_CASE("Ldid::create fails without an ID when a random draw fails", "[ldid]") {
  SECTION("failure on the 12-bit draw stops before the 62-bit draw") {
    MockGenerator gen;
    gen.random_bits_fn = [](int) { return random_failure(); };

    const auto result = Ldid::create(gen);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == IdErrorCode::kRandomSource);
    CHECK(result.error().message == "mock error");
    CHECK(gen.requested_widths == std::vector<int>{12});
  }

  SECTION("failure on the 62-bit draw") {
    MockGenerator gen;
    gen.random_bits_fn = [](int width) {
      return width >= 62 ? random_failure() : random_ok(0x123);
    };

    const auto result = Ldid::create(gen);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == IdErrorCode::kRandomSource);
    CHECK(gen.requested_widths == (std::vector<int>{12, 62}));
  }

  SECTION("other generator errors are passed through unchanged") {
    MockGenerator gen;
    gen.random_bits_fn = [](int) {
      return ldid::core::Result<std::uint64_t, ldid::core::IdError>::err(
          {IdErrorCode::kInvalidWidth, "generator refused width"});
    };

    const auto result = Ldid::create(gen);
    REQUIRE_FALSE(result.has_value());
    const ldid::core::IdError expected{IdErrorCode::kInvalidWidth, "generator refused width"};
    CHECK(result.error() == expected);
  }
}

TEST_CASE("Ldid accessors return each generator input modulo its field width", "[ldid]") {
  namespace layout = ldid::id::layout;
  struct Inputs {
    std::uint64_t timestamp;
    std::uint64_t random;
  };

  for (const Inputs in : {Inputs{0, 0}, Inputs{1700000000123ull, 0x0123456789ABCDEFull},
                          Inputs{0x1000000000000ull, 0xFFFFFFFFFFFFFFFFull},
                          Inputs{0xFFFFFFFFFFFFull, 0x8000000000000001ull}}) {
    FixedGenerator gen(in.timestamp, in.random);
    const auto result = Ldid::create(gen);
    REQUIRE(result.has_value());

    CHECK(result.value().timestamp().value() == (in.timestamp & 0xFFFFFFFFFFFFull));
    CHECK(result.value().version().value() == layout::kVersionTag);
    CHECK(result.value().rand_a().value() == (in.random & 0xFFFull));
    CHECK(result.value().variant().value() == layout::kVariantTag);
    CHECK(result.value().rand_b().value() == (in.random & 0x3FFFFFFFFFFFFFFFull));
  }
}

TEST_CASE("Ldid byte layout matches the field table", "[ldid]") {
  FixedGenerator gen(0x0123456789ABull, 0);
  const auto result = Ldid::create(gen);
  REQUIRE(result.has_value());

  const auto& b = result.value().bytes();
  CHECK(b[0] == 0x01);
  CHECK(b[5] == 0xAB);
  CHECK(b[6] == 0x70);  // version nibble, then rand_a high nibble
  CHECK(b[7] == 0x00);
  CHECK(b[8] == 0x80);  // variant bits 10, then rand_b
  CHECK(result.value().to_string() == "01234567-89ab-7000-8000-000000000000");
}

TEST_CASE("Ldid ordering follows the timestamp", "[ldid]") {
  FixedGenerator earlier_gen(1000, 0xFFFFFFFFFFFFFFFFull);
  FixedGenerator later_gen(1001, 0);
  const auto earlier = Ldid::create(earlier_gen);
  const auto later = Ldid::create(later_gen);
  REQUIRE(earlier.has_value());
  REQUIRE(later.has_value());

  CHECK(earlier.value() < later.value());
  CHECK(earlier.value() != later.value());
}

TEST_CASE("Ldid::generate produces distinct values", "[ldid][system]") {
  const auto a = Ldid::generate();
  const auto b = Ldid::generate();
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  CHECK(a.value() != b.value());
}
