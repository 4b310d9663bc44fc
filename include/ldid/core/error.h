#pragma once

#include <string>
#include <string_view>

namespace ldid::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).
enum class IdErrorCode {
  kInvalidWidth,  // bit width outside [1, 64]
  kRange,         // offset + width past the end of the buffer, or value does not fit
  kRandomSource,  // entropy source failed to produce output
  kFormat,        // canonical string or raw byte input is malformed
};

// IdError pairs a code with a message for diagnostics.
// Callers branch on code; message is for humans only.
struct IdError {
  IdErrorCode code;     // NOLINT(readability-identifier-naming)
  std::string message;  // NOLINT(readability-identifier-naming)

  bool operator==(const IdError&) const = default;
};

// Stable lower-case name of the code: "invalid_width", "range", "random_source", "format".
[[nodiscard]] std::string_view to_string(IdErrorCode code);

// "<code>: <message>"
[[nodiscard]] std::string describe(const IdError& error);

}  // namespace ldid::core
