// === Spatial Reference =======================================================
//
// Library-neutral description of a coordinate reference system and the pure
// compatibility rule applied before any boundary is overlaid on a raster.

#pragma once

#include <string>
#include <string_view>

namespace green_coverage {

/** @brief Broad family of a coordinate reference system. */
enum class CrsKind {
    Geographic, /**< Angular coordinates (degrees). */
    Projected,  /**< Planar coordinates in a linear unit. */
    Local,      /**< Engineering/local system with no earth anchoring. */
    Unknown     /**< Missing or unparseable definition. */
};

/**
 * @brief Minimal CRS summary extracted from a dataset.
 */
struct CrsDescriptor final {
    std::string identifier{};       /**< Authority code such as `EPSG:4326`, otherwise the WKT. */
    std::string wkt{};              /**< Full WKT definition, empty when unknown. */
    CrsKind kind{CrsKind::Unknown};
    std::string linear_unit_name{}; /**< Linear unit of projected systems (e.g. `metre`). */
    double linear_unit_to_m{1.0};   /**< Conversion factor from the linear unit to metres. */

    [[nodiscard]] bool empty() const noexcept { return identifier.empty() && wkt.empty(); }
};

/** @brief Outcome of comparing a boundary CRS with a raster CRS. */
enum class CrsCompatibility {
    Compatible,              /**< Identical systems; overlay directly. */
    ReprojectionRecommended, /**< Different but transformable; overlay a reprojected copy. */
    Incompatible             /**< No transform exists; analysis must stop. */
};

[[nodiscard]] std::string_view to_string(CrsKind kind) noexcept;
[[nodiscard]] std::string_view to_string(CrsCompatibility compatibility) noexcept;

/**
 * @brief Classify a CRS pair.
 *
 * Identical non-empty identifiers are compatible. A local or unknown system on
 * either side, or a missing transform, is incompatible. Everything else needs
 * reprojection.
 */
[[nodiscard]] CrsCompatibility classify_crs_pair(const CrsDescriptor& geometry_crs,
                                                 const CrsDescriptor& raster_crs,
                                                 bool transform_available) noexcept;

}  // namespace green_coverage
