#include "green_coverage/ndvi_analyzer.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <limits>
#include <numbers>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "green_coverage/errors.hpp"
#include "green_coverage/gdal_sources.hpp"
#include "green_coverage/logging.hpp"

namespace green_coverage {

namespace {

constexpr double k_earth_radius_m{6'371'008.8};
constexpr double k_m2_per_km2{1'000'000.0};
constexpr std::size_t k_max_listed_names{10};

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

/**
 * @brief Running mean/variance (Welford) with min and max.
 */
class NdviAccumulator final {
  public:
    void add(double value) noexcept {
        ++count_;
        const double delta = value - mean_;
        mean_ += delta / static_cast<double>(count_);
        m2_ += delta * (value - mean_);
        min_ = std::min(min_, value);
        max_ = std::max(max_, value);
    }

    [[nodiscard]] std::size_t count() const noexcept { return count_; }
    [[nodiscard]] double mean() const noexcept { return mean_; }
    [[nodiscard]] double population_std() const noexcept {
        return count_ == 0 ? 0.0 : std::sqrt(m2_ / static_cast<double>(count_));
    }
    [[nodiscard]] double min() const noexcept { return min_; }
    [[nodiscard]] double max() const noexcept { return max_; }

  private:
    std::size_t count_{0};
    double mean_{0.0};
    double m2_{0.0};
    double min_{std::numeric_limits<double>::infinity()};
    double max_{-std::numeric_limits<double>::infinity()};
};

/**
 * @brief Ground area of individual pixels in square metres.
 *
 * Projected rasters have a constant cell area. Geographic rasters are scaled
 * by the cosine of each cell's centre latitude on a spherical earth.
 */
class PixelAreaModel final {
  public:
    PixelAreaModel(const GeoTransform& geotransform, const CrsDescriptor& crs)
        : geotransform_(geotransform),
          flag_geographic_(crs.kind == CrsKind::Geographic) {
        if (flag_geographic_) {
            const double metres_per_degree = k_earth_radius_m * std::numbers::pi / 180.0;
            area_factor_ = geotransform.pixel_area() * metres_per_degree * metres_per_degree;
        } else {
            area_factor_ = geotransform.pixel_area() * crs.linear_unit_to_m * crs.linear_unit_to_m;
        }
    }

    [[nodiscard]] double area_m2(int row, int col) const noexcept {
        if (!flag_geographic_) {
            return area_factor_;
        }
        const MapPoint centre = geotransform_.apply(col + 0.5, row + 0.5);
        return area_factor_ * std::abs(std::cos(centre.y * std::numbers::pi / 180.0));
    }

  private:
    GeoTransform geotransform_;
    bool flag_geographic_;
    double area_factor_{};
};

void validate_parameters(const NdviParameters& parameters, const RasterSource& raster) {
    if (!(parameters.ndvi_threshold >= -1.0 && parameters.ndvi_threshold <= 1.0)) {
        throw std::invalid_argument(fmt::format("NDVI threshold {} is outside [-1, 1]", parameters.ndvi_threshold));
    }
    const int band_count = raster.band_count();
    for (const int band : {parameters.red_band_index, parameters.nir_band_index}) {
        if (band < 0 || band >= band_count) {
            throw std::invalid_argument(
                fmt::format("Band index {} is out of range; raster {} has {} bands", band, raster.description(), band_count)
            );
        }
    }
    if (parameters.tile_rows <= 0) {
        throw std::invalid_argument("tile_rows must be positive");
    }
}

void check_deadline(const std::optional<TimePoint>& deadline, const std::string& city_name) {
    if (deadline.has_value() && SteadyClock::now() >= deadline.value()) {
        throw CoverageError(ErrorKind::ComputeTimeout, "Coverage analysis for " + city_name + " exceeded its time limit");
    }
}

}  // namespace

std::optional<double> compute_ndvi(double red,
                                   double nir,
                                   std::optional<double> red_nodata,
                                   std::optional<double> nir_nodata) noexcept {
    if (std::isnan(red) || std::isnan(nir)) {
        return std::nullopt;
    }
    if ((red_nodata.has_value() && red == red_nodata.value()) || (nir_nodata.has_value() && nir == nir_nodata.value())) {
        return std::nullopt;
    }
    const double denominator = nir + red;
    if (denominator == 0.0) {
        return std::nullopt;
    }
    return std::clamp((nir - red) / denominator, -1.0, 1.0);
}

const BoundaryGeometry& find_city_feature(const BoundaryCollection& boundaries, const std::string& city_name) {
    const std::string needle = to_lower(city_name);

    std::vector<const BoundaryGeometry*> exact_matches;
    std::vector<const BoundaryGeometry*> partial_matches;
    for (const BoundaryGeometry& feature : boundaries.features) {
        const std::string candidate = to_lower(feature.name);
        if (candidate == needle) {
            exact_matches.push_back(&feature);
        } else if (!needle.empty() && candidate.find(needle) != std::string::npos) {
            partial_matches.push_back(&feature);
        }
    }

    const auto& matches = exact_matches.empty() ? partial_matches : exact_matches;
    if (matches.size() == 1) {
        return *matches.front();
    }
    if (matches.size() > 1) {
        std::vector<std::string> names;
        for (const BoundaryGeometry* feature : matches) {
            names.push_back(feature->name);
        }
        throw CoverageError(
            ErrorKind::AmbiguousCity,
            fmt::format("City '{}' matches {} boundaries: {}", city_name, matches.size(), fmt::join(names, ", ")),
            "use the full boundary name"
        );
    }

    std::vector<std::string> available;
    for (const BoundaryGeometry& feature : boundaries.features) {
        if (available.size() == k_max_listed_names) {
            break;
        }
        available.push_back(feature.name);
    }
    throw CoverageError(
        ErrorKind::CityNotFound,
        fmt::format("City '{}' not found in boundary data. Available cities: {}", city_name, fmt::join(available, ", "))
    );
}

CoverageAnalyzer::CoverageAnalyzer(TransformFactory transform_factory)
    : reconciler_(std::move(transform_factory)) {}

CoverageResult CoverageAnalyzer::compute_coverage(const BoundaryCollection& boundaries,
                                                  RasterSource& raster,
                                                  const std::string& city_name,
                                                  const NdviParameters& parameters,
                                                  std::optional<TimePoint> deadline) const {
    validate_parameters(parameters, raster);
    check_deadline(deadline, city_name);

    const BoundaryGeometry& feature = find_city_feature(boundaries, city_name);
    const ReconciledGeometry reconciled = reconciler_.reconcile(boundaries.crs, feature, raster);
    const PixelWindow window = reconciled.window_within(raster.width(), raster.height());
    const ScanlineMask mask{reconciled.pixel_polygons, window};

    const std::optional<double> red_nodata = raster.nodata(parameters.red_band_index);
    const std::optional<double> nir_nodata = raster.nodata(parameters.nir_band_index);
    const PixelAreaModel area_model{raster.geotransform(), raster.crs()};

    NdviAccumulator accumulator{};
    std::size_t vegetated_pixels = 0;
    std::size_t invalid_pixels = 0;
    double total_area_m2 = 0.0;
    double vegetated_area_m2 = 0.0;

    PixelBlockStream stream{raster, window, parameters.red_band_index, parameters.nir_band_index, parameters.tile_rows};
    while (std::optional<PixelBlock> block = stream.next()) {
        const PixelWindow& block_window = block->window;
        for (int row_index = 0; row_index < block_window.height; ++row_index) {
            const int row = block_window.row_offset + row_index;
            const std::size_t row_base = static_cast<std::size_t>(row_index) * static_cast<std::size_t>(block_window.width);
            for (const auto& [first, last] : mask.spans(row)) {
                for (int col = first; col < last; ++col) {
                    const std::size_t offset = row_base + static_cast<std::size_t>(col - block_window.col_offset);
                    const std::optional<double> ndvi = compute_ndvi(block->red[offset], block->nir[offset], red_nodata, nir_nodata);
                    if (!ndvi.has_value()) {
                        ++invalid_pixels;
                        continue;
                    }
                    accumulator.add(ndvi.value());
                    const double cell_area = area_model.area_m2(row, col);
                    total_area_m2 += cell_area;
                    if (ndvi.value() >= parameters.ndvi_threshold) {
                        ++vegetated_pixels;
                        vegetated_area_m2 += cell_area;
                    }
                }
            }
        }
        check_deadline(deadline, city_name);
    }

    if (accumulator.count() == 0) {
        throw CoverageError(
            ErrorKind::NoValidPixels,
            fmt::format("No valid NDVI pixels inside the boundary of {} ({} invalid)", feature.name, invalid_pixels),
            "check that the raster covers the city and that the band indices are correct"
        );
    }

    CoverageResult result{};
    result.city_name = city_name;
    result.total_pixels = accumulator.count();
    result.vegetated_pixels = vegetated_pixels;
    result.invalid_pixels = invalid_pixels;
    result.coverage_percentage = 100.0 * static_cast<double>(vegetated_pixels) / static_cast<double>(result.total_pixels);
    result.total_area_m2 = total_area_m2;
    result.vegetated_area_m2 = vegetated_area_m2;
    result.total_area_km2 = total_area_m2 / k_m2_per_km2;
    result.vegetated_area_km2 = vegetated_area_m2 / k_m2_per_km2;
    result.ndvi_mean = accumulator.mean();
    result.ndvi_std = accumulator.population_std();
    result.ndvi_min = accumulator.min();
    result.ndvi_max = accumulator.max();
    result.ndvi_threshold = parameters.ndvi_threshold;
    result.coordinate_system = raster.crs().identifier;
    result.year = parameters.year.value_or(utc_year(WallClock::now()));
    result.measurement_method = fmt::format("NDVI-based analysis (threshold: {})", parameters.ndvi_threshold);
    result.reprojected = reconciled.reprojected;

    log_event(spdlog::level::info, "analyzer", "coverage_computed", {
        {"city", result.city_name},
        {"coverage_pct", result.coverage_percentage},
        {"valid_pixels", result.total_pixels},
        {"vegetated_pixels", result.vegetated_pixels},
        {"invalid_pixels", result.invalid_pixels}
    });
    return result;
}

CoverageResult CoverageAnalyzer::compute_coverage_from_files(const std::filesystem::path& boundary_path,
                                                             const std::filesystem::path& raster_path,
                                                             const std::string& city_name,
                                                             const NdviParameters& parameters,
                                                             std::optional<TimePoint> deadline) const {
    validate_boundary_extension(boundary_path);
    validate_raster_extension(raster_path);

    const BoundaryCollection boundaries = load_boundaries(boundary_path, parameters.name_field);
    RasterSourcePtr raster = open_raster(raster_path);
    return compute_coverage(boundaries, *raster, city_name, parameters, deadline);
}

}  // namespace green_coverage
