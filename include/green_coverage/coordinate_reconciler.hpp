// === Coordinate Reconciler ===================================================
//
// Validates and aligns a boundary's coordinate reference system with a
// raster's before analysis. Produces a transformed copy of the boundary in
// raster pixel space; the loaded geometry is never mutated.

#pragma once

#include <functional>
#include <memory>
#include <vector>

#include "green_coverage/geometry.hpp"
#include "green_coverage/raster_source.hpp"
#include "green_coverage/spatial_reference.hpp"

namespace green_coverage {

/**
 * @brief Point transformation between two coordinate reference systems.
 */
class CoordinateTransform {
  public:
    virtual ~CoordinateTransform() = default;

    /** @brief Transform `points` in place; throws `CoverageError` on failure. */
    virtual void transform(std::vector<MapPoint>& points) const = 0;
};

using CoordinateTransformPtr = std::unique_ptr<CoordinateTransform>;

/**
 * @brief Builds a transform between two systems, or returns null when none exists.
 */
using TransformFactory = std::function<CoordinateTransformPtr(const CrsDescriptor& from, const CrsDescriptor& to)>;

/**
 * @brief Boundary expressed in raster pixel coordinates.
 */
struct ReconciledGeometry final {
    std::vector<PolygonShape> pixel_polygons{};
    Envelope pixel_envelope{};
    CrsCompatibility compatibility{CrsCompatibility::Compatible};
    bool reprojected{false};

    /** @brief Raster cells touched by the envelope, clipped to the raster extent. */
    [[nodiscard]] PixelWindow window_within(int raster_width, int raster_height) const noexcept;
};

/**
 * @brief Applies the CRS compatibility rule and produces pixel-space geometry.
 */
class CoordinateReconciler final {
  public:
    explicit CoordinateReconciler(TransformFactory transform_factory);

    /**
     * @brief Reconcile one feature against `raster`.
     *
     * Throws `CoverageError(SpatialMismatch)` when the systems are
     * incompatible or the raster geotransform is singular.
     */
    [[nodiscard]] ReconciledGeometry reconcile(const CrsDescriptor& geometry_crs,
                                               const BoundaryGeometry& feature,
                                               const RasterSource& raster) const;

  private:
    TransformFactory transform_factory_;
};

}  // namespace green_coverage
