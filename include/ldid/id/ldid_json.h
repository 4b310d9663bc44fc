#pragma once

#include "ldid/id/ldid.h"

#include <nlohmann/json.hpp>

namespace ldid::id {

// Field breakdown of an LDID for inspection output.
// Keys: id, timestamp_ms, timestamp (ISO-8601 UTC), version, rand_a, variant, rand_b.
// Key order in dump() is alphabetical (nlohmann::json uses std::map internally).
[[nodiscard]] nlohmann::json ldid_to_json(const Ldid& id);

}  // namespace ldid::id
