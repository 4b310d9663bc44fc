#include "ldid/core/error.h"

namespace ldid::core {

std::string_view to_string(const IdErrorCode code) {
  switch (code) {
    case IdErrorCode::kInvalidWidth:
      return "invalid_width";
    case IdErrorCode::kRange:
      return "range";
    case IdErrorCode::kRandomSource:
      return "random_source";
    case IdErrorCode::kFormat:
      return "format";
  }
  return "unknown";
}

std::string describe(const IdError& error) {
  std::string out{to_string(error.code)};
  out += ": ";
  out += error.message;
  return out;
}

}  // namespace ldid::core
