// === NDVI Coverage Analyzer ==================================================
//
// Computes the vegetation-coverage statistic of one city boundary over one
// multi-band raster. The clip is streamed in row strips so peak memory stays
// bounded by one strip of two bands regardless of city size.

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "green_coverage/coordinate_reconciler.hpp"
#include "green_coverage/geometry.hpp"
#include "green_coverage/raster_source.hpp"
#include "green_coverage/types.hpp"

namespace green_coverage {

/**
 * @brief Knobs of one NDVI analysis.
 */
struct NdviParameters final {
    double ndvi_threshold{0.3};    /**< Vegetated when NDVI >= threshold; must lie in [-1, 1]. */
    int red_band_index{0};         /**< Zero-based red band. */
    int nir_band_index{1};         /**< Zero-based near-infrared band. */
    std::optional<int> year{};     /**< Imagery year; current UTC year when empty. */
    std::string name_field{"NAME"};/**< Boundary attribute holding the city name. */
    int tile_rows{256};            /**< Rows per streamed strip. */
};

/**
 * @brief Coverage statistic for one city.
 */
struct CoverageResult final {
    std::string city_name{};
    double coverage_percentage{};
    std::size_t total_pixels{};      /**< Valid pixels inside the boundary. */
    std::size_t vegetated_pixels{};
    std::size_t invalid_pixels{};    /**< Pixels inside the boundary excluded as invalid. */
    double total_area_m2{};
    double vegetated_area_m2{};
    double total_area_km2{};
    double vegetated_area_km2{};
    double ndvi_mean{};
    double ndvi_std{};               /**< Population standard deviation. */
    double ndvi_min{};
    double ndvi_max{};
    double ndvi_threshold{};
    std::string coordinate_system{};
    int year{};
    std::string measurement_method{};
    bool reprojected{false};
};

/**
 * @brief NDVI-based coverage computation.
 */
class CoverageAnalyzer final {
  public:
    explicit CoverageAnalyzer(TransformFactory transform_factory);

    /**
     * @brief Compute coverage for `city_name` over `raster`.
     *
     * @throws std::invalid_argument for a threshold outside [-1, 1] or a band
     *         index the raster does not have.
     * @throws CoverageError CityNotFound, AmbiguousCity, SpatialMismatch,
     *         NoValidPixels or ComputeTimeout.
     */
    [[nodiscard]] CoverageResult compute_coverage(const BoundaryCollection& boundaries,
                                                  RasterSource& raster,
                                                  const std::string& city_name,
                                                  const NdviParameters& parameters,
                                                  std::optional<TimePoint> deadline = std::nullopt) const;

    /**
     * @brief Load a boundary file and a raster file through GDAL and compute.
     *
     * Extensions are validated before either file is opened.
     */
    [[nodiscard]] CoverageResult compute_coverage_from_files(const std::filesystem::path& boundary_path,
                                                             const std::filesystem::path& raster_path,
                                                             const std::string& city_name,
                                                             const NdviParameters& parameters,
                                                             std::optional<TimePoint> deadline = std::nullopt) const;

  private:
    CoordinateReconciler reconciler_;
};

/**
 * @brief Locate the feature named `city_name`.
 *
 * Case-insensitive exact match first, then case-insensitive containment.
 */
[[nodiscard]] const BoundaryGeometry& find_city_feature(const BoundaryCollection& boundaries, const std::string& city_name);

/** @brief NDVI of one sample, or empty when the sample is invalid. */
[[nodiscard]] std::optional<double> compute_ndvi(double red,
                                                 double nir,
                                                 std::optional<double> red_nodata,
                                                 std::optional<double> nir_nodata) noexcept;

}  // namespace green_coverage
