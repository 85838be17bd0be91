#include "green_coverage/cache_payload.hpp"

#include <stdexcept>
#include <type_traits>

namespace green_coverage {

using json = nlohmann::json;

void to_json(json& document, const CoverageResult& result) {
    document = json{
        {"city_name", result.city_name},
        {"coverage_percentage", result.coverage_percentage},
        {"total_pixels", result.total_pixels},
        {"vegetated_pixels", result.vegetated_pixels},
        {"invalid_pixels", result.invalid_pixels},
        {"total_area_m2", result.total_area_m2},
        {"vegetated_area_m2", result.vegetated_area_m2},
        {"total_area_km2", result.total_area_km2},
        {"vegetated_area_km2", result.vegetated_area_km2},
        {"ndvi_mean", result.ndvi_mean},
        {"ndvi_std", result.ndvi_std},
        {"ndvi_min", result.ndvi_min},
        {"ndvi_max", result.ndvi_max},
        {"ndvi_threshold", result.ndvi_threshold},
        {"coordinate_system", result.coordinate_system},
        {"year", result.year},
        {"measurement_method", result.measurement_method},
        {"reprojected", result.reprojected},
    };
}

void from_json(const json& document, CoverageResult& result) {
    document.at("city_name").get_to(result.city_name);
    document.at("coverage_percentage").get_to(result.coverage_percentage);
    document.at("total_pixels").get_to(result.total_pixels);
    document.at("vegetated_pixels").get_to(result.vegetated_pixels);
    document.at("invalid_pixels").get_to(result.invalid_pixels);
    document.at("total_area_m2").get_to(result.total_area_m2);
    document.at("vegetated_area_m2").get_to(result.vegetated_area_m2);
    document.at("total_area_km2").get_to(result.total_area_km2);
    document.at("vegetated_area_km2").get_to(result.vegetated_area_km2);
    document.at("ndvi_mean").get_to(result.ndvi_mean);
    document.at("ndvi_std").get_to(result.ndvi_std);
    document.at("ndvi_min").get_to(result.ndvi_min);
    document.at("ndvi_max").get_to(result.ndvi_max);
    document.at("ndvi_threshold").get_to(result.ndvi_threshold);
    document.at("coordinate_system").get_to(result.coordinate_system);
    document.at("year").get_to(result.year);
    document.at("measurement_method").get_to(result.measurement_method);
    result.reprojected = document.value("reprojected", false);
}

void to_json(json& document, const CoverageComparison& comparison) {
    document = json{
        {"city_name", comparison.city_name},
        {"city_green_coverage_percentage", comparison.city_coverage_percentage},
        {"who_recommendation_percentage", comparison.recommendation_percentage},
        {"difference_points", comparison.difference_points},
        {"comparison_result", comparison.comparison_result},
        {"year", comparison.year},
    };
}

void from_json(const json& document, CoverageComparison& comparison) {
    document.at("city_name").get_to(comparison.city_name);
    document.at("city_green_coverage_percentage").get_to(comparison.city_coverage_percentage);
    document.at("who_recommendation_percentage").get_to(comparison.recommendation_percentage);
    document.at("difference_points").get_to(comparison.difference_points);
    document.at("comparison_result").get_to(comparison.comparison_result);
    document.at("year").get_to(comparison.year);
}

void to_json(json& document, const StoredCoverage& stored) {
    document = json{
        {"city_name", stored.city_name},
        {"year", stored.year},
        {"coverage_percentage", stored.coverage_percentage},
        {"data_source", stored.data_source},
        {"measurement_method", stored.measurement_method},
        {"total_area_km2", stored.total_area_km2},
        {"green_area_km2", stored.green_area_km2},
    };
}

void from_json(const json& document, StoredCoverage& stored) {
    document.at("city_name").get_to(stored.city_name);
    document.at("year").get_to(stored.year);
    document.at("coverage_percentage").get_to(stored.coverage_percentage);
    document.at("data_source").get_to(stored.data_source);
    document.at("measurement_method").get_to(stored.measurement_method);
    document.at("total_area_km2").get_to(stored.total_area_km2);
    document.at("green_area_km2").get_to(stored.green_area_km2);
}

bool payload_matches(const CalculationType& type, const CachePayload& payload) noexcept {
    switch (type.kind()) {
        case CalculationType::Kind::Satellite:
            return std::holds_alternative<CoverageResult>(payload);
        case CalculationType::Kind::Stats:
            return std::holds_alternative<CoverageComparison>(payload);
        case CalculationType::Kind::Stored:
            return std::holds_alternative<StoredCoverage>(payload);
        case CalculationType::Kind::Custom:
            return std::holds_alternative<CustomPayload>(payload);
    }
    return false;
}

std::string encode_payload(const CachePayload& payload) {
    return std::visit(
        [](const auto& value) -> std::string {
            using Value = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<Value, CustomPayload>) {
                return value.document.dump();
            } else {
                return json(value).dump();
            }
        },
        payload
    );
}

CachePayload decode_payload(const CalculationType& type, const std::string& encoded) {
    try {
        const json document = json::parse(encoded);
        switch (type.kind()) {
            case CalculationType::Kind::Satellite:
                return document.get<CoverageResult>();
            case CalculationType::Kind::Stats:
                return document.get<CoverageComparison>();
            case CalculationType::Kind::Stored:
                return document.get<StoredCoverage>();
            case CalculationType::Kind::Custom:
                break;
        }
        return CustomPayload{document};
    } catch (const json::exception& exc) {
        throw std::invalid_argument("Corrupt " + type.name() + " payload: " + exc.what());
    }
}

}  // namespace green_coverage
