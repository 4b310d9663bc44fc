#pragma once

#include "ldid/id/generator.h"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace ldid::cli {

inline constexpr std::uint64_t kMaxGenerateCount = 100000;

struct GenerateConfig {
  std::uint64_t count{1};                      // NOLINT(readability-identifier-naming)
  bool json{false};                            // NOLINT(readability-identifier-naming)
  bool verbose{false};                         // NOLINT(readability-identifier-naming)
  std::optional<std::uint64_t> fixed_time_ms;  // NOLINT(readability-identifier-naming)
  std::optional<std::uint64_t> fixed_random;   // NOLINT(readability-identifier-naming)
};

// validate_generate_config returns an empty string when config is usable, otherwise a
// message suitable for printing verbatim.
// Rules: 1 <= count <= kMaxGenerateCount; --fixed-time and --fixed-random come together.
[[nodiscard]] std::string validate_generate_config(const GenerateConfig& config);

// execute_generate writes config.count LDIDs built from generator to out: one canonical
// string per line, or a single JSON array of field objects when config.json is set.
// The first generator failure is reported on err and ends the run with exit code 1.
int execute_generate(const GenerateConfig& config, id::IGenerator& generator, std::ostream& out,
                     std::ostream& err);

}  // namespace ldid::cli
