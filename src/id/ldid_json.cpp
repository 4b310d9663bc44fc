#include "ldid/id/ldid_json.h"

#include "ldid/core/time.h"

namespace ldid::id {

nlohmann::json ldid_to_json(const Ldid& id) {
  // Accessors cannot fail for a constructed Ldid; value() would throw if they did.
  const std::uint64_t timestamp_ms = id.timestamp().value();

  nlohmann::json j;
  j["id"] = id.to_string();
  j["timestamp_ms"] = timestamp_ms;
  j["timestamp"] = core::format_unix_ms_iso8601(timestamp_ms);
  j["version"] = id.version().value();
  j["rand_a"] = id.rand_a().value();
  j["variant"] = id.variant().value();
  j["rand_b"] = id.rand_b().value();
  return j;
}

}  // namespace ldid::id
