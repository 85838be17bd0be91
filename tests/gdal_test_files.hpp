// === GDAL Test Files =========================================================
//
// Writes small GeoTIFF rasters and GeoJSON boundary files through GDAL so the
// adapters and the service can be exercised against real datasets.

#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <fmt/format.h>
#include <gdal_priv.h>
#include <ogr_spatialref.h>

#include "green_coverage/gdal_sources.hpp"
#include "test_fixtures.hpp"

namespace green_coverage::test {

inline constexpr int k_size{10};

/**
 * @brief Two-band Float64 GeoTIFF whose first `vegetated` cells read NDVI 2/3
 * and the rest NDVI -2/3.
 */
inline void write_geotiff(const std::filesystem::path& path, int epsg_code, const GeoTransform& geotransform, int vegetated) {
    GDALAllRegister();
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
    REQUIRE(driver != nullptr);
    GDALDatasetPtr dataset{driver->Create(path.string().c_str(), k_size, k_size, 2, GDT_Float64, nullptr)};
    REQUIRE(dataset != nullptr);

    GeoTransform writable = geotransform;
    REQUIRE(dataset->SetGeoTransform(writable.coefficients.data()) == CE_None);
    OGRSpatialReference spatial_reference{};
    REQUIRE(spatial_reference.importFromEPSG(epsg_code) == OGRERR_NONE);
    REQUIRE(dataset->SetSpatialRef(&spatial_reference) == CE_None);

    std::vector<double> red(k_size * k_size);
    std::vector<double> nir(k_size * k_size);
    for (int index = 0; index < k_size * k_size; ++index) {
        const bool green = index < vegetated;
        red[static_cast<std::size_t>(index)] = green ? 0.1 : 0.5;
        nir[static_cast<std::size_t>(index)] = green ? 0.5 : 0.1;
    }
    REQUIRE(dataset->GetRasterBand(1)->RasterIO(GF_Write, 0, 0, k_size, k_size, red.data(), k_size, k_size, GDT_Float64, 0, 0, nullptr) == CE_None);
    REQUIRE(dataset->GetRasterBand(2)->RasterIO(GF_Write, 0, 0, k_size, k_size, nir.data(), k_size, k_size, GDT_Float64, 0, 0, nullptr) == CE_None);
}

inline std::string ring_json(const LinearRing& ring) {
    std::string text = "[";
    for (std::size_t index = 0; index < ring.size(); ++index) {
        text += fmt::format("{}[{:.10f},{:.10f}]", index == 0 ? "" : ",", ring[index].x, ring[index].y);
    }
    return text + "]";
}

/**
 * @brief GeoJSON FeatureCollection (WGS84 longitude/latitude) of named rings.
 */
inline void write_geojson(const std::filesystem::path& path, const std::vector<std::pair<std::string, LinearRing>>& features) {
    std::string text = R"({"type":"FeatureCollection","features":[)";
    for (std::size_t index = 0; index < features.size(); ++index) {
        text += fmt::format(
            R"({}{{"type":"Feature","properties":{{"NAME":"{}","POP":{}}},"geometry":{{"type":"Polygon","coordinates":[{}]}}}})",
            index == 0 ? "" : ",",
            features[index].first,
            1000 * (index + 1),
            ring_json(features[index].second)
        );
    }
    text += "]}";
    std::ofstream stream{path, std::ios::trunc};
    stream << text;
}

/** @brief Geographic grid of 0.001 degree cells with its top-left corner at 10E 50N. */
inline GeoTransform degree_grid() {
    return GeoTransform{{10.0, 0.001, 0.0, 50.0, 0.0, -0.001}};
}

inline LinearRing degree_cells(int col0, int row0, int col1, int row1) {
    const GeoTransform grid = degree_grid();
    const MapPoint top_left = grid.apply(col0, row0);
    const MapPoint bottom_right = grid.apply(col1, row1);
    return rectangle(top_left.x, bottom_right.y, bottom_right.x, top_left.y);
}

}  // namespace green_coverage::test
