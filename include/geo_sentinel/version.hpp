// === Version Metadata ========================================================
//
// Exposes the engine's semantic version string used in logs.

#pragma once

#include <string_view>

namespace geo_sentinel {

inline constexpr std::string_view k_version{"0.1.0"};

}  // namespace geo_sentinel
