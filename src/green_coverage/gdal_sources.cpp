#include "green_coverage/gdal_sources.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <cpl_conv.h>
#include <cpl_error.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <ogr_geometry.h>
#include <ogrsf_frmts.h>

#include "green_coverage/errors.hpp"
#include "green_coverage/logging.hpp"

namespace green_coverage {

namespace {

constexpr std::array<std::string_view, 4> k_vector_extensions{".shp", ".geojson", ".json", ".gpkg"};
constexpr std::array<std::string_view, 4> k_raster_extensions{".tif", ".tiff", ".img", ".jp2"};
constexpr std::size_t k_max_sample_names{10};

std::once_flag gdal_registration_flag;

void ensure_gdal_registered() {
    std::call_once(gdal_registration_flag, []() { GDALAllRegister(); });
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

template <std::size_t N>
void validate_extension(const std::filesystem::path& path,
                        const std::array<std::string_view, N>& allowed,
                        std::string_view kind) {
    const std::string extension = to_lower(path.extension().string());
    if (std::find(allowed.begin(), allowed.end(), extension) == allowed.end()) {
        throw CoverageError(
            ErrorKind::UnsupportedFormat,
            fmt::format("Unsupported {} file type '{}' for {}", kind, extension, path.string()),
            fmt::format("supported extensions: {}", fmt::join(allowed, ", "))
        );
    }
}

void require_exists(const std::filesystem::path& path) {
    std::error_code error_exists;
    if (!std::filesystem::exists(path, error_exists)) {
        throw CoverageError(ErrorKind::MissingInput, "Input file not found: " + path.string());
    }
}

GDALDatasetPtr open_dataset(const std::filesystem::path& path, unsigned int open_flags) {
    ensure_gdal_registered();
    require_exists(path);
    GDALDataset* raw = GDALDataset::Open(path.string().c_str(), open_flags | GDAL_OF_READONLY);
    if (raw == nullptr) {
        throw CoverageError(
            ErrorKind::UnsupportedFormat,
            fmt::format("GDAL could not open {}: {}", path.string(), CPLGetLastErrorMsg())
        );
    }
    return GDALDatasetPtr(raw);
}

OGRLayer* first_layer(GDALDataset& dataset, const std::filesystem::path& path) {
    if (dataset.GetLayerCount() < 1 || dataset.GetLayer(0) == nullptr) {
        throw CoverageError(ErrorKind::UnsupportedFormat, "Boundary file has no layers: " + path.string());
    }
    return dataset.GetLayer(0);
}

std::optional<std::string> guess_name_field(const OGRFeatureDefn& definition) {
    for (int index = 0; index < definition.GetFieldCount(); ++index) {
        const std::string field_name = definition.GetFieldDefn(index)->GetNameRef();
        if (to_lower(field_name).find("name") != std::string::npos) {
            return field_name;
        }
    }
    return std::nullopt;
}

LinearRing convert_ring(const OGRLinearRing* ring) {
    LinearRing converted;
    if (ring == nullptr) {
        return converted;
    }
    const int point_count = ring->getNumPoints();
    converted.reserve(static_cast<std::size_t>(point_count));
    for (int index = 0; index < point_count; ++index) {
        converted.push_back(MapPoint{ring->getX(index), ring->getY(index)});
    }
    return converted;
}

PolygonShape convert_polygon(const OGRPolygon* polygon) {
    PolygonShape shape{};
    shape.exterior = convert_ring(polygon->getExteriorRing());
    for (int index = 0; index < polygon->getNumInteriorRings(); ++index) {
        shape.interiors.push_back(convert_ring(polygon->getInteriorRing(index)));
    }
    return shape;
}

std::vector<PolygonShape> convert_geometry(const OGRGeometry* geometry) {
    std::vector<PolygonShape> polygons;
    if (geometry == nullptr) {
        return polygons;
    }
    switch (wkbFlatten(geometry->getGeometryType())) {
        case wkbPolygon:
            polygons.push_back(convert_polygon(geometry->toPolygon()));
            break;
        case wkbMultiPolygon: {
            const OGRMultiPolygon* multi = geometry->toMultiPolygon();
            for (int index = 0; index < multi->getNumGeometries(); ++index) {
                polygons.push_back(convert_polygon(multi->getGeometryRef(index)));
            }
            break;
        }
        default:
            break;
    }
    return polygons;
}

/**
 * @brief Owns an OGR coordinate transformation.
 */
class OgrCoordinateTransform final : public CoordinateTransform {
  public:
    struct Deleter final {
        void operator()(OGRCoordinateTransformation* transformation) const noexcept {
            OGRCoordinateTransformation::DestroyCT(transformation);
        }
    };
    using TransformationPtr = std::unique_ptr<OGRCoordinateTransformation, Deleter>;

    explicit OgrCoordinateTransform(TransformationPtr transformation)
        : transformation_(std::move(transformation)) {}

    void transform(std::vector<MapPoint>& points) const override {
        if (points.empty()) {
            return;
        }
        std::vector<double> list_x;
        std::vector<double> list_y;
        list_x.reserve(points.size());
        list_y.reserve(points.size());
        for (const MapPoint& point : points) {
            list_x.push_back(point.x);
            list_y.push_back(point.y);
        }
        if (!transformation_->Transform(points.size(), list_x.data(), list_y.data())) {
            throw CoverageError(
                ErrorKind::SpatialMismatch,
                fmt::format("Coordinate transformation failed: {}", CPLGetLastErrorMsg()),
                "check that the boundary lies inside the raster CRS area of use"
            );
        }
        for (std::size_t index = 0; index < points.size(); ++index) {
            points[index] = MapPoint{list_x[index], list_y[index]};
        }
    }

  private:
    TransformationPtr transformation_;
};

bool import_descriptor(const CrsDescriptor& descriptor, OGRSpatialReference& spatial_reference) {
    OGRErr error = OGRERR_FAILURE;
    if (!descriptor.wkt.empty()) {
        error = spatial_reference.importFromWkt(descriptor.wkt.c_str());
    } else if (!descriptor.identifier.empty()) {
        error = spatial_reference.SetFromUserInput(descriptor.identifier.c_str());
    }
    spatial_reference.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    return error == OGRERR_NONE;
}

}  // namespace

void validate_boundary_extension(const std::filesystem::path& path) {
    validate_extension(path, k_vector_extensions, "boundary");
}

void validate_raster_extension(const std::filesystem::path& path) {
    validate_extension(path, k_raster_extensions, "raster");
}

CrsDescriptor describe_spatial_reference(const OGRSpatialReference* spatial_reference) {
    CrsDescriptor descriptor{};
    if (spatial_reference == nullptr || spatial_reference->IsEmpty()) {
        return descriptor;
    }

    char* raw_wkt = nullptr;
    if (spatial_reference->exportToWkt(&raw_wkt) == OGRERR_NONE && raw_wkt != nullptr) {
        descriptor.wkt = raw_wkt;
    }
    CPLFree(raw_wkt);

    OGRSpatialReference identified{*spatial_reference};
    const char* authority_name = identified.GetAuthorityName(nullptr);
    const char* authority_code = identified.GetAuthorityCode(nullptr);
    if ((authority_name == nullptr || authority_code == nullptr) && identified.AutoIdentifyEPSG() == OGRERR_NONE) {
        authority_name = identified.GetAuthorityName(nullptr);
        authority_code = identified.GetAuthorityCode(nullptr);
    }
    if (authority_name != nullptr && authority_code != nullptr) {
        descriptor.identifier = fmt::format("{}:{}", authority_name, authority_code);
    } else {
        descriptor.identifier = descriptor.wkt;
    }

    if (spatial_reference->IsProjected()) {
        descriptor.kind = CrsKind::Projected;
        const char* unit_name = nullptr;
        descriptor.linear_unit_to_m = spatial_reference->GetLinearUnits(&unit_name);
        descriptor.linear_unit_name = unit_name != nullptr ? unit_name : "metre";
    } else if (spatial_reference->IsGeographic()) {
        descriptor.kind = CrsKind::Geographic;
        descriptor.linear_unit_name = "degree";
    } else if (spatial_reference->IsLocal()) {
        descriptor.kind = CrsKind::Local;
        const char* unit_name = nullptr;
        descriptor.linear_unit_to_m = spatial_reference->GetLinearUnits(&unit_name);
        descriptor.linear_unit_name = unit_name != nullptr ? unit_name : "unknown";
    }
    return descriptor;
}

GdalRasterSource::GdalRasterSource(const std::filesystem::path& path)
    : str_description_(path.string()),
      dataset_(open_dataset(path, GDAL_OF_RASTER)) {
    crs_ = describe_spatial_reference(dataset_->GetSpatialRef());
    if (dataset_->GetGeoTransform(geotransform_.coefficients.data()) != CE_None) {
        get_logger()->warn("Raster {} has no geotransform; using the identity", str_description_);
    }
}

const std::string& GdalRasterSource::description() const noexcept {
    return str_description_;
}

const CrsDescriptor& GdalRasterSource::crs() const noexcept {
    return crs_;
}

const GeoTransform& GdalRasterSource::geotransform() const noexcept {
    return geotransform_;
}

int GdalRasterSource::width() const noexcept {
    return dataset_->GetRasterXSize();
}

int GdalRasterSource::height() const noexcept {
    return dataset_->GetRasterYSize();
}

int GdalRasterSource::band_count() const noexcept {
    return dataset_->GetRasterCount();
}

std::optional<double> GdalRasterSource::nodata(int band) const {
    GDALRasterBand* raster_band = dataset_->GetRasterBand(band + 1);
    if (raster_band == nullptr) {
        return std::nullopt;
    }
    int has_nodata = 0;
    const double value = raster_band->GetNoDataValue(&has_nodata);
    if (has_nodata == 0) {
        return std::nullopt;
    }
    return value;
}

void GdalRasterSource::read_window(int band, const PixelWindow& window, std::vector<double>& buffer) {
    buffer.resize(window.cell_count());
    if (window.empty()) {
        return;
    }
    GDALRasterBand* raster_band = dataset_->GetRasterBand(band + 1);
    if (raster_band == nullptr) {
        throw std::invalid_argument(fmt::format("Raster {} has no band {}", str_description_, band));
    }
    const CPLErr error = raster_band->RasterIO(
        GF_Read,
        window.col_offset,
        window.row_offset,
        window.width,
        window.height,
        buffer.data(),
        window.width,
        window.height,
        GDT_Float64,
        0,
        0,
        nullptr
    );
    if (error != CE_None) {
        throw CoverageError(
            ErrorKind::UnsupportedFormat,
            fmt::format("RasterIO failed on {} band {}: {}", str_description_, band, CPLGetLastErrorMsg())
        );
    }
}

RasterSourcePtr open_raster(const std::filesystem::path& path) {
    validate_raster_extension(path);
    return std::make_unique<GdalRasterSource>(path);
}

BoundaryCollection load_boundaries(const std::filesystem::path& path, const std::string& name_field) {
    validate_boundary_extension(path);
    GDALDatasetPtr dataset = open_dataset(path, GDAL_OF_VECTOR);
    OGRLayer* layer = first_layer(*dataset, path);
    auto logger = get_logger();

    const OGRFeatureDefn* definition = layer->GetLayerDefn();
    int name_index = definition->GetFieldIndex(name_field.c_str());
    if (name_index < 0) {
        const std::optional<std::string> fallback = guess_name_field(*definition);
        if (!fallback.has_value()) {
            throw CoverageError(
                ErrorKind::UnsupportedFormat,
                fmt::format("Boundary file {} has no '{}' attribute and no attribute containing 'name'", path.string(), name_field),
                "pass the attribute holding city names as the name field"
            );
        }
        logger->warn("Name field {} not found in {}; using {}", name_field, path.string(), fallback.value());
        name_index = definition->GetFieldIndex(fallback->c_str());
    }

    BoundaryCollection collection{};
    collection.crs = describe_spatial_reference(layer->GetSpatialRef());

    layer->ResetReading();
    std::size_t skipped_features = 0;
    for (OGRFeatureUniquePtr feature{layer->GetNextFeature()}; feature != nullptr; feature.reset(layer->GetNextFeature())) {
        BoundaryGeometry boundary{};
        boundary.name = feature->GetFieldAsString(name_index);
        boundary.polygons = convert_geometry(feature->GetGeometryRef());
        if (boundary.polygons.empty()) {
            ++skipped_features;
            continue;
        }
        collection.features.push_back(std::move(boundary));
    }
    logger->debug("Loaded {} boundaries from {} ({} non-polygon features skipped)",
                  collection.features.size(),
                  path.string(),
                  skipped_features);
    return collection;
}

BoundarySourceInfo describe_boundaries(const std::filesystem::path& path) {
    validate_boundary_extension(path);
    GDALDatasetPtr dataset = open_dataset(path, GDAL_OF_VECTOR);
    OGRLayer* layer = first_layer(*dataset, path);

    BoundarySourceInfo info{};
    info.path = path.string();
    info.feature_count = static_cast<std::size_t>(std::max<GIntBig>(0, layer->GetFeatureCount()));
    info.crs = describe_spatial_reference(layer->GetSpatialRef());

    const OGRFeatureDefn* definition = layer->GetLayerDefn();
    for (int index = 0; index < definition->GetFieldCount(); ++index) {
        info.fields.emplace_back(definition->GetFieldDefn(index)->GetNameRef());
    }
    info.name_field = guess_name_field(*definition);

    OGREnvelope extent{};
    if (layer->GetExtent(&extent, TRUE) == OGRERR_NONE) {
        info.bounds.expand(MapPoint{extent.MinX, extent.MinY});
        info.bounds.expand(MapPoint{extent.MaxX, extent.MaxY});
    }

    const int name_index = info.name_field.has_value() ? definition->GetFieldIndex(info.name_field->c_str()) : -1;
    layer->ResetReading();
    for (OGRFeatureUniquePtr feature{layer->GetNextFeature()}; feature != nullptr; feature.reset(layer->GetNextFeature())) {
        if (const OGRGeometry* geometry = feature->GetGeometryRef(); geometry != nullptr) {
            const std::string type_name = OGRGeometryTypeToName(wkbFlatten(geometry->getGeometryType()));
            if (std::find(info.geometry_types.begin(), info.geometry_types.end(), type_name) == info.geometry_types.end()) {
                info.geometry_types.push_back(type_name);
            }
        }
        if (name_index >= 0 && info.sample_names.size() < k_max_sample_names) {
            info.sample_names.emplace_back(feature->GetFieldAsString(name_index));
        }
    }
    return info;
}

CrsValidationReport validate_coordinate_systems(const std::filesystem::path& boundary_path,
                                                const std::filesystem::path& raster_path) {
    validate_boundary_extension(boundary_path);
    validate_raster_extension(raster_path);

    CrsValidationReport report{};
    {
        GDALDatasetPtr vector_dataset = open_dataset(boundary_path, GDAL_OF_VECTOR);
        report.boundary_crs = describe_spatial_reference(first_layer(*vector_dataset, boundary_path)->GetSpatialRef());
    }
    report.raster_crs = GdalRasterSource{raster_path}.crs();

    const bool transform_available = make_gdal_transform(report.boundary_crs, report.raster_crs) != nullptr;
    report.verdict = classify_crs_pair(report.boundary_crs, report.raster_crs, transform_available);
    switch (report.verdict) {
        case CrsCompatibility::Compatible:
            report.recommendation = "Coordinate systems match; no reprojection needed";
            break;
        case CrsCompatibility::ReprojectionRecommended:
            report.recommendation = fmt::format("Boundary will be reprojected from {} to {} during analysis",
                                                report.boundary_crs.identifier,
                                                report.raster_crs.identifier);
            break;
        case CrsCompatibility::Incompatible:
            report.recommendation = fmt::format("Reproject the boundary file to {} before analysis",
                                                report.raster_crs.identifier.empty() ? "the raster CRS" : report.raster_crs.identifier);
            break;
    }
    return report;
}

CoordinateTransformPtr make_gdal_transform(const CrsDescriptor& from, const CrsDescriptor& to) {
    OGRSpatialReference source_reference{};
    OGRSpatialReference target_reference{};
    if (!import_descriptor(from, source_reference) || !import_descriptor(to, target_reference)) {
        return nullptr;
    }
    OgrCoordinateTransform::TransformationPtr transformation{
        OGRCreateCoordinateTransformation(&source_reference, &target_reference)
    };
    if (transformation == nullptr) {
        return nullptr;
    }
    return std::make_unique<OgrCoordinateTransform>(std::move(transformation));
}

TransformFactory gdal_transform_factory() {
    return [](const CrsDescriptor& from, const CrsDescriptor& to) { return make_gdal_transform(from, to); };
}

}  // namespace green_coverage
