// === Coverage Assessment =====================================================
//
// Stored per-year coverage records and their comparison against the WHO urban
// green-space recommendation.

#pragma once

#include <string>

#include "green_coverage/ndvi_analyzer.hpp"

namespace green_coverage {

/** @brief WHO recommendation for urban green coverage, in percent. */
inline constexpr double k_who_recommendation_percentage{30.0};

/**
 * @brief Persisted coverage figure for one city and year.
 */
struct StoredCoverage final {
    std::string city_name{};
    int year{};
    double coverage_percentage{};
    std::string data_source{};
    std::string measurement_method{};
    double total_area_km2{};
    double green_area_km2{};
};

/**
 * @brief City coverage set against a recommendation.
 */
struct CoverageComparison final {
    std::string city_name{};
    double city_coverage_percentage{};
    double recommendation_percentage{};
    double difference_points{}; /**< City minus recommendation. */
    std::string comparison_result{};
    int year{};
};

/** @brief Stored record derived from a satellite analysis. */
[[nodiscard]] StoredCoverage to_stored_coverage(const CoverageResult& result, const std::string& data_source);

/**
 * @brief Compare `coverage_percentage` with `recommendation_percentage`.
 *
 * The assessment text is tiered by the gap in percentage points: 10, 5 and 0
 * above; 15, 10 and 5 below.
 */
[[nodiscard]] CoverageComparison compare_with_recommendation(const std::string& city_name,
                                                             double coverage_percentage,
                                                             int year,
                                                             double recommendation_percentage = k_who_recommendation_percentage);

}  // namespace green_coverage
