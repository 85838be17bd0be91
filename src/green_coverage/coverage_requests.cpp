#include "green_coverage/coverage_requests.hpp"

#include <stdexcept>

namespace green_coverage {

CacheRequest satellite_request(const std::string& city_name,
                               std::optional<std::int64_t> city_id,
                               const std::filesystem::path& raster_path,
                               const std::filesystem::path& boundary_path,
                               const NdviParameters& parameters) {
    if (!parameters.year.has_value()) {
        throw std::invalid_argument("Satellite requests need an explicit imagery year");
    }
    CacheRequest request{};
    request.type = CalculationType::satellite();
    request.city_name = city_name;
    request.city_id = city_id;
    request.key_params.set("city_name", city_name)
        .set("ndvi_threshold", parameters.ndvi_threshold)
        .set("red_band_idx", parameters.red_band_index)
        .set("nir_band_idx", parameters.nir_band_index)
        .set("name_column", parameters.name_field)
        .set("year", parameters.year.value())
        .set_file_digest("raster_hash", raster_path)
        .set_file_digest("shapefile_hash", boundary_path);
    return request;
}

CacheRequest comparison_request(const std::string& city_name, std::optional<std::int64_t> city_id) {
    CacheRequest request{};
    request.type = CalculationType::stats();
    request.city_name = city_name;
    request.city_id = city_id;
    request.key_params.set("city_name", city_name).set("operation", "coverage_comparison");
    return request;
}

}  // namespace green_coverage
