// === Version Metadata ========================================================
//
// Exposes the engine's semantic version string used in logs and the CLI.

#pragma once

#include <string_view>

namespace green_coverage {

inline constexpr std::string_view k_version{"1.0.0"};

}  // namespace green_coverage
