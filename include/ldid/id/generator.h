#pragma once

#include "ldid/core/clock.h"
#include "ldid/core/error.h"
#include "ldid/core/result.h"
#include "ldid/random/entropy_source.h"

#include <cstdint>

namespace ldid::id {

// Abstract generator interface supplying the two variable inputs of an LDID.
// Ldid::create() depends only on this interface, so tests can substitute deterministic
// inputs. Implementations may be called concurrently; any shared state behind them must
// be thread-safe.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IGenerator {
 public:
  virtual ~IGenerator() = default;

  // Milliseconds since the Unix epoch. Never fails.
  virtual std::uint64_t now_ms() = 0;

  // Uniform integer in [0, 2^width).
  // Contract: kInvalidWidth for width outside [1, 64]; kRandomSource on entropy failure.
  virtual core::Result<std::uint64_t, core::IdError> random_bits(int width) = 0;

 protected:
  IGenerator() = default;
  IGenerator(const IGenerator&) = default;
  IGenerator& operator=(const IGenerator&) = default;
  IGenerator(IGenerator&&) = default;
  IGenerator& operator=(IGenerator&&) = default;
};

// Production generator: wall clock + kernel CSPRNG.
// Holds references (not ownership); the referenced clock and source must outlive it.
// The default constructor binds process-wide SystemClock and SystemEntropySource instances.
class SystemGenerator final : public IGenerator {
 public:
  SystemGenerator();
  SystemGenerator(core::IClock& clock, random::IEntropySource& entropy)
      : clock_(&clock), entropy_(&entropy) {}
  ~SystemGenerator() override = default;

  SystemGenerator(const SystemGenerator&) = default;
  SystemGenerator& operator=(const SystemGenerator&) = default;
  SystemGenerator(SystemGenerator&&) = default;
  SystemGenerator& operator=(SystemGenerator&&) = default;

  std::uint64_t now_ms() override;
  core::Result<std::uint64_t, core::IdError> random_bits(int width) override;

 private:
  core::IClock* clock_;
  random::IEntropySource* entropy_;
};

// Deterministic generator for demos and reproducible output.
// now_ms() returns timestamp_ms; random_bits(n) returns raw_random mod 2^n after the
// usual width validation.
class FixedGenerator final : public IGenerator {
 public:
  FixedGenerator(std::uint64_t timestamp_ms, std::uint64_t raw_random)
      : timestamp_ms_(timestamp_ms), raw_random_(raw_random) {}
  ~FixedGenerator() override = default;

  FixedGenerator(const FixedGenerator&) = default;
  FixedGenerator& operator=(const FixedGenerator&) = default;
  FixedGenerator(FixedGenerator&&) = default;
  FixedGenerator& operator=(FixedGenerator&&) = default;

  std::uint64_t now_ms() override;
  core::Result<std::uint64_t, core::IdError> random_bits(int width) override;

 private:
  std::uint64_t timestamp_ms_;
  std::uint64_t raw_random_;
};

}  // namespace ldid::id
