#include "ldid/id/generator.h"

#include "ldid/bits/bit_buffer.h"
#include "ldid/random/random_bits.h"

namespace ldid::id {

namespace {

// Both are stateless; sharing one instance across threads is safe.
core::SystemClock& process_clock() {
  static core::SystemClock clock;
  return clock;
}

random::SystemEntropySource& process_entropy() {
  static random::SystemEntropySource source;
  return source;
}

}  // namespace

SystemGenerator::SystemGenerator() : clock_(&process_clock()), entropy_(&process_entropy()) {}

std::uint64_t SystemGenerator::now_ms() {
  return clock_->now_unix_ms();
}

core::Result<std::uint64_t, core::IdError> SystemGenerator::random_bits(const int width) {
  return random::draw_random_bits(*entropy_, width);
}

std::uint64_t FixedGenerator::now_ms() {
  return timestamp_ms_;
}

core::Result<std::uint64_t, core::IdError> FixedGenerator::random_bits(const int width) {
  const auto valid = random::validate_random_width(width);
  if (!valid.has_value()) {
    return core::Result<std::uint64_t, core::IdError>::err(valid.error());
  }
  return core::Result<std::uint64_t, core::IdError>::ok(raw_random_ &
                                                        bits::low_bits_mask(width));
}

}  // namespace ldid::id
