// === Version Metadata ========================================================
//
// Exposes the mission core's semantic version string used in logs and reports.

#pragma once

#include <string_view>

namespace harvest_bot {

inline constexpr std::string_view k_version{"0.1.0"};

}  // namespace harvest_bot
