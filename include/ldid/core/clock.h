#pragma once

#include <cstdint>

namespace ldid::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests/demos use fixed timestamps.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Milliseconds since the Unix epoch (UTC).
  virtual std::uint64_t now_unix_ms() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time. Stateless, safe to share across threads.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::uint64_t now_unix_ms() override;
};

// Fixed clock: returns constant timestamp for deterministic tests/demos.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::uint64_t fixed_ms) : fixed_ms_(fixed_ms) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::uint64_t now_unix_ms() override;

 private:
  std::uint64_t fixed_ms_;
};

}  // namespace ldid::core
