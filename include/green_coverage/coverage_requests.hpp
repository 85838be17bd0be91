// === Coverage Requests =======================================================
//
// Builders for the cache requests of the built-in computations, shared by the
// scheduler and direct callers so both land on the same cache keys.

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "green_coverage/cache_orchestrator.hpp"
#include "green_coverage/ndvi_analyzer.hpp"

namespace green_coverage {

/**
 * @brief Satellite analysis request.
 *
 * The key covers the city, every NDVI parameter and the digests of both input
 * files. `parameters.year` must be set.
 *
 * @throws CoverageError(MissingInput) when either file cannot be read.
 */
[[nodiscard]] CacheRequest satellite_request(const std::string& city_name,
                                             std::optional<std::int64_t> city_id,
                                             const std::filesystem::path& raster_path,
                                             const std::filesystem::path& boundary_path,
                                             const NdviParameters& parameters);

/** @brief Recommendation comparison request for one city. */
[[nodiscard]] CacheRequest comparison_request(const std::string& city_name, std::optional<std::int64_t> city_id);

}  // namespace green_coverage
