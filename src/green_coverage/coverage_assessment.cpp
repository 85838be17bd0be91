#include "green_coverage/coverage_assessment.hpp"

#include <cmath>

#include <fmt/format.h>

namespace green_coverage {

StoredCoverage to_stored_coverage(const CoverageResult& result, const std::string& data_source) {
    StoredCoverage stored{};
    stored.city_name = result.city_name;
    stored.year = result.year;
    stored.coverage_percentage = result.coverage_percentage;
    stored.data_source = data_source;
    stored.measurement_method = result.measurement_method;
    stored.total_area_km2 = result.total_area_km2;
    stored.green_area_km2 = result.vegetated_area_km2;
    return stored;
}

CoverageComparison compare_with_recommendation(const std::string& city_name,
                                               double coverage_percentage,
                                               int year,
                                               double recommendation_percentage) {
    CoverageComparison comparison{};
    comparison.city_name = city_name;
    comparison.city_coverage_percentage = coverage_percentage;
    comparison.recommendation_percentage = recommendation_percentage;
    comparison.difference_points = coverage_percentage - recommendation_percentage;
    comparison.year = year;

    const double difference = comparison.difference_points;
    if (difference >= 0.0) {
        if (difference >= 10.0) {
            comparison.comparison_result = fmt::format(
                "Excellent! {} exceeds WHO recommendations by {:.1f} percentage points, indicating a very healthy urban environment.",
                city_name, difference);
        } else if (difference >= 5.0) {
            comparison.comparison_result = fmt::format(
                "Great! {} exceeds WHO recommendations by {:.1f} percentage points, showing good environmental planning.",
                city_name, difference);
        } else {
            comparison.comparison_result = fmt::format(
                "Good! {} meets WHO recommendations with {:.1f} percentage points above the threshold.",
                city_name, difference);
        }
        return comparison;
    }

    const double gap = std::abs(difference);
    if (gap >= 15.0) {
        comparison.comparison_result = fmt::format(
            "Critical: {} is {:.1f} percentage points below WHO recommendations. Significant improvement in green infrastructure is needed.",
            city_name, gap);
    } else if (gap >= 10.0) {
        comparison.comparison_result = fmt::format(
            "Below standard: {} is {:.1f} percentage points below WHO recommendations. More green spaces are needed.",
            city_name, gap);
    } else if (gap >= 5.0) {
        comparison.comparison_result = fmt::format(
            "Moderate gap: {} is {:.1f} percentage points below WHO recommendations. Additional green initiatives would be beneficial.",
            city_name, gap);
    } else {
        comparison.comparison_result = fmt::format(
            "Nearly meets standard: {} is {:.1f} percentage points below WHO recommendations. Small improvements would reach the target.",
            city_name, gap);
    }
    return comparison;
}

}  // namespace green_coverage
