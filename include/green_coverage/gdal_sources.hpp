// === GDAL Sources ============================================================
//
// Adapters between GDAL/OGR and the engine's library-neutral model: raster
// datasets become `RasterSource`s, vector layers become `BoundaryCollection`s
// and `OGRSpatialReference`s become `CrsDescriptor`s. Also hosts the file
// inspection helpers used by operators before a run.
//
// External dependencies
// - GDAL (`gdal_priv.h`, `ogrsf_frmts.h`, `ogr_spatialref.h`).

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <gdal_priv.h>
#include <ogr_spatialref.h>

#include "green_coverage/coordinate_reconciler.hpp"
#include "green_coverage/geometry.hpp"
#include "green_coverage/raster_source.hpp"
#include "green_coverage/spatial_reference.hpp"

namespace green_coverage {

struct GDALDatasetDeleter final {
    void operator()(GDALDataset* dataset) const noexcept {
        if (dataset != nullptr) {
            GDALClose(dataset);
        }
    }
};

using GDALDatasetPtr = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;

/**
 * @brief Raster backed by a GDAL dataset opened read-only.
 */
class GdalRasterSource final : public RasterSource {
  public:
    /**
     * @brief Open `path`.
     *
     * @throws CoverageError MissingInput when the file does not exist,
     *         UnsupportedFormat when GDAL cannot open it.
     */
    explicit GdalRasterSource(const std::filesystem::path& path);

    [[nodiscard]] const std::string& description() const noexcept override;
    [[nodiscard]] const CrsDescriptor& crs() const noexcept override;
    [[nodiscard]] const GeoTransform& geotransform() const noexcept override;
    [[nodiscard]] int width() const noexcept override;
    [[nodiscard]] int height() const noexcept override;
    [[nodiscard]] int band_count() const noexcept override;
    [[nodiscard]] std::optional<double> nodata(int band) const override;
    void read_window(int band, const PixelWindow& window, std::vector<double>& buffer) override;

  private:
    std::string str_description_;
    GDALDatasetPtr dataset_;
    CrsDescriptor crs_;
    GeoTransform geotransform_;
};

/**
 * @brief Summary of a boundary file for operators.
 */
struct BoundarySourceInfo final {
    std::string path{};
    std::size_t feature_count{};
    std::vector<std::string> fields{};
    CrsDescriptor crs{};
    Envelope bounds{};
    std::vector<std::string> geometry_types{};
    std::optional<std::string> name_field{}; /**< First attribute whose name contains "name". */
    std::vector<std::string> sample_names{};  /**< Up to ten values of `name_field`. */
};

/**
 * @brief Verdict on overlaying a boundary file on a raster file.
 */
struct CrsValidationReport final {
    CrsCompatibility verdict{CrsCompatibility::Incompatible};
    CrsDescriptor boundary_crs{};
    CrsDescriptor raster_crs{};
    std::string recommendation{};
};

/** @brief Throws `CoverageError(UnsupportedFormat)` unless `path` has a vector extension. */
void validate_boundary_extension(const std::filesystem::path& path);

/** @brief Throws `CoverageError(UnsupportedFormat)` unless `path` has a raster extension. */
void validate_raster_extension(const std::filesystem::path& path);

[[nodiscard]] RasterSourcePtr open_raster(const std::filesystem::path& path);

/**
 * @brief Load every polygon feature of the first layer of `path`.
 *
 * Falls back to the first attribute containing "name" when `name_field` is
 * absent from the layer.
 */
[[nodiscard]] BoundaryCollection load_boundaries(const std::filesystem::path& path, const std::string& name_field);

[[nodiscard]] BoundarySourceInfo describe_boundaries(const std::filesystem::path& path);

[[nodiscard]] CrsValidationReport validate_coordinate_systems(const std::filesystem::path& boundary_path,
                                                              const std::filesystem::path& raster_path);

/** @brief Summarize an OGR spatial reference; null yields an unknown descriptor. */
[[nodiscard]] CrsDescriptor describe_spatial_reference(const OGRSpatialReference* spatial_reference);

/** @brief OGR-backed transform, or null when the pair cannot be transformed. */
[[nodiscard]] CoordinateTransformPtr make_gdal_transform(const CrsDescriptor& from, const CrsDescriptor& to);

/** @brief `TransformFactory` wrapping `make_gdal_transform`. */
[[nodiscard]] TransformFactory gdal_transform_factory();

}  // namespace green_coverage
