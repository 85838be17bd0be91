#include "green_coverage/coordinate_reconciler.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "green_coverage/errors.hpp"
#include "green_coverage/logging.hpp"

namespace green_coverage {

namespace {

void to_pixel_space(LinearRing& ring, const GeoTransform& inverse, Envelope* envelope) {
    for (MapPoint& point : ring) {
        point = inverse.apply(point.x, point.y);
        if (envelope != nullptr) {
            envelope->expand(point);
        }
    }
}

std::string reprojection_hint(const CrsDescriptor& raster_crs) {
    const std::string target = raster_crs.identifier.empty() ? std::string{"the raster CRS"} : raster_crs.identifier;
    return "reproject the boundary file to " + target;
}

}  // namespace

PixelWindow ReconciledGeometry::window_within(int raster_width, int raster_height) const noexcept {
    if (!pixel_envelope.valid()) {
        return PixelWindow{};
    }
    const double first_col = std::clamp(std::floor(pixel_envelope.min_x), 0.0, static_cast<double>(raster_width));
    const double end_col = std::clamp(std::ceil(pixel_envelope.max_x), 0.0, static_cast<double>(raster_width));
    const double first_row = std::clamp(std::floor(pixel_envelope.min_y), 0.0, static_cast<double>(raster_height));
    const double end_row = std::clamp(std::ceil(pixel_envelope.max_y), 0.0, static_cast<double>(raster_height));
    return PixelWindow{
        static_cast<int>(first_col),
        static_cast<int>(first_row),
        static_cast<int>(end_col - first_col),
        static_cast<int>(end_row - first_row)
    };
}

CoordinateReconciler::CoordinateReconciler(TransformFactory transform_factory)
    : transform_factory_(std::move(transform_factory)) {}

ReconciledGeometry CoordinateReconciler::reconcile(const CrsDescriptor& geometry_crs,
                                                   const BoundaryGeometry& feature,
                                                   const RasterSource& raster) const {
    const CrsDescriptor& raster_crs = raster.crs();

    CoordinateTransformPtr transform{};
    CrsCompatibility compatibility = classify_crs_pair(geometry_crs, raster_crs, true);
    if (compatibility == CrsCompatibility::ReprojectionRecommended) {
        if (transform_factory_) {
            transform = transform_factory_(geometry_crs, raster_crs);
        }
        compatibility = classify_crs_pair(geometry_crs, raster_crs, transform != nullptr);
    }

    if (compatibility == CrsCompatibility::Incompatible) {
        throw CoverageError(
            ErrorKind::SpatialMismatch,
            "Boundary CRS '" + geometry_crs.identifier + "' cannot be aligned with raster CRS '" + raster_crs.identifier + "'",
            reprojection_hint(raster_crs)
        );
    }

    const std::optional<GeoTransform> inverse = raster.geotransform().inverse();
    if (!inverse.has_value()) {
        throw CoverageError(
            ErrorKind::SpatialMismatch,
            "Raster " + raster.description() + " has a non-invertible geotransform",
            "assign a valid georeference to the raster"
        );
    }

    ReconciledGeometry reconciled{};
    reconciled.compatibility = compatibility;
    reconciled.pixel_polygons = feature.polygons;

    if (transform != nullptr) {
        log_event(spdlog::level::warn, "reconciler", "reproject", {
            {"feature", feature.name},
            {"from", geometry_crs.identifier},
            {"to", raster_crs.identifier}
        });
        for (PolygonShape& polygon : reconciled.pixel_polygons) {
            transform->transform(polygon.exterior);
            for (LinearRing& hole : polygon.interiors) {
                transform->transform(hole);
            }
        }
        reconciled.reprojected = true;
    }

    for (PolygonShape& polygon : reconciled.pixel_polygons) {
        to_pixel_space(polygon.exterior, inverse.value(), &reconciled.pixel_envelope);
        for (LinearRing& hole : polygon.interiors) {
            to_pixel_space(hole, inverse.value(), nullptr);
        }
    }
    return reconciled;
}

}  // namespace green_coverage
