#include "green_coverage/spatial_reference.hpp"

namespace green_coverage {

std::string_view to_string(CrsKind kind) noexcept {
    switch (kind) {
        case CrsKind::Geographic:
            return "geographic";
        case CrsKind::Projected:
            return "projected";
        case CrsKind::Local:
            return "local";
        case CrsKind::Unknown:
            break;
    }
    return "unknown";
}

std::string_view to_string(CrsCompatibility compatibility) noexcept {
    switch (compatibility) {
        case CrsCompatibility::Compatible:
            return "compatible";
        case CrsCompatibility::ReprojectionRecommended:
            return "reprojection_recommended";
        case CrsCompatibility::Incompatible:
            break;
    }
    return "incompatible";
}

CrsCompatibility classify_crs_pair(const CrsDescriptor& geometry_crs,
                                   const CrsDescriptor& raster_crs,
                                   bool transform_available) noexcept {
    if (!geometry_crs.identifier.empty() && geometry_crs.identifier == raster_crs.identifier) {
        return CrsCompatibility::Compatible;
    }
    const auto anchored = [](CrsKind kind) { return kind == CrsKind::Geographic || kind == CrsKind::Projected; };
    if (!anchored(geometry_crs.kind) || !anchored(raster_crs.kind) || !transform_available) {
        return CrsCompatibility::Incompatible;
    }
    return CrsCompatibility::ReprojectionRecommended;
}

}  // namespace green_coverage
