#include "inspect_logic.h"

#include "ldid/core/time.h"
#include "ldid/id/layout.h"
#include "ldid/id/ldid.h"
#include "ldid/id/ldid_json.h"

#include <cstdint>
#include <iomanip>

namespace ldid::cli {

int execute_inspect(const std::string& text, const bool json, std::ostream& out,
                    std::ostream& err) {
  const auto parsed = id::Ldid::from_string(text);
  if (!parsed.has_value()) {
    err << "Error: cannot parse '" << text << "': " << core::describe(parsed.error()) << "\n";
    return 1;
  }
  const id::Ldid& decoded = parsed.value();

  const std::uint64_t version = decoded.version().value();
  const std::uint64_t variant = decoded.variant().value();
  if (version != id::layout::kVersionTag) {
    err << "Warning: version field is " << version << ", expected " << id::layout::kVersionTag
        << "\n";
  }
  if (variant != id::layout::kVariantTag) {
    err << "Warning: variant field is " << variant << ", expected " << id::layout::kVariantTag
        << "\n";
  }

  if (json) {
    out << id::ldid_to_json(decoded).dump(2) << "\n";
    return 0;
  }

  const std::uint64_t timestamp = decoded.timestamp().value();
  out << "id:        " << decoded.to_string() << "\n";
  out << "timestamp: " << timestamp << " (" << core::format_unix_ms_iso8601(timestamp) << ")\n";
  out << "version:   " << version << "\n";
  out << "variant:   " << variant << "\n";
  out << std::hex << std::setfill('0');
  out << "rand_a:    0x" << std::setw(3) << decoded.rand_a().value() << "\n";
  out << "rand_b:    0x" << std::setw(16) << decoded.rand_b().value() << "\n";
  out << std::dec << std::setfill(' ');
  return 0;
}

}  // namespace ldid::cli
