#pragma once

namespace ldid::core {

// kBuildVersion is the current software version string.
// Updated once per release slice.
constexpr const char* kBuildVersion = "0.2";

}  // namespace ldid::core
