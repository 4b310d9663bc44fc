#pragma once

#include "ldid/core/error.h"
#include "ldid/core/result.h"

#include <cstdint>
#include <span>

namespace ldid::random {

// Abstract source of cryptographically secure bytes.
// Production code reads the kernel CSPRNG; tests substitute scripted or failing sources.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IEntropySource {
 public:
  virtual ~IEntropySource() = default;

  // Fill every byte of out, or fail with kRandomSource.
  // Contract: on failure the contents of out are unspecified and must not be used.
  virtual core::Result<bool, core::IdError> fill(std::span<std::uint8_t> out) = 0;

 protected:
  IEntropySource() = default;
  IEntropySource(const IEntropySource&) = default;
  IEntropySource& operator=(const IEntropySource&) = default;
  IEntropySource(IEntropySource&&) = default;
  IEntropySource& operator=(IEntropySource&&) = default;
};

// Kernel CSPRNG via getrandom(2). Stateless and thread-safe.
// Blocks only until the kernel entropy pool is initialised (early boot); never times out.
class SystemEntropySource final : public IEntropySource {
 public:
  SystemEntropySource() = default;
  ~SystemEntropySource() override = default;

  SystemEntropySource(const SystemEntropySource&) = default;
  SystemEntropySource& operator=(const SystemEntropySource&) = default;
  SystemEntropySource(SystemEntropySource&&) = default;
  SystemEntropySource& operator=(SystemEntropySource&&) = default;

  core::Result<bool, core::IdError> fill(std::span<std::uint8_t> out) override;
};

}  // namespace ldid::random
