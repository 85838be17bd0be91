// === Test Fixtures ===========================================================
//
// In-memory raster, polygon builders and a manual wall clock shared by the
// analyzer, cache and scheduler tests.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "green_coverage/geometry.hpp"
#include "green_coverage/raster_source.hpp"
#include "green_coverage/types.hpp"

namespace green_coverage::test {

/**
 * @brief Raster held in memory, band-major, with a read counter.
 */
class MemoryRasterSource final : public RasterSource {
  public:
    MemoryRasterSource(int width, int height, int band_count, GeoTransform geotransform, CrsDescriptor crs)
        : width_(width),
          height_(height),
          geotransform_(geotransform),
          crs_(std::move(crs)),
          list_bands_(static_cast<std::size_t>(band_count),
                      std::vector<double>(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), 0.0)),
          list_nodata_(static_cast<std::size_t>(band_count)) {}

    void set(int band, int row, int col, double value) {
        list_bands_.at(static_cast<std::size_t>(band)).at(index(row, col)) = value;
    }

    void fill(int band, double value) {
        std::fill(list_bands_.at(static_cast<std::size_t>(band)).begin(), list_bands_.at(static_cast<std::size_t>(band)).end(), value);
    }

    void set_nodata(int band, double value) {
        list_nodata_.at(static_cast<std::size_t>(band)) = value;
    }

    [[nodiscard]] std::size_t read_calls() const noexcept { return read_calls_; }
    [[nodiscard]] std::size_t max_rows_read() const noexcept { return max_rows_read_; }

    [[nodiscard]] const std::string& description() const noexcept override { return str_description_; }
    [[nodiscard]] const CrsDescriptor& crs() const noexcept override { return crs_; }
    [[nodiscard]] const GeoTransform& geotransform() const noexcept override { return geotransform_; }
    [[nodiscard]] int width() const noexcept override { return width_; }
    [[nodiscard]] int height() const noexcept override { return height_; }
    [[nodiscard]] int band_count() const noexcept override { return static_cast<int>(list_bands_.size()); }
    [[nodiscard]] std::optional<double> nodata(int band) const override {
        return list_nodata_.at(static_cast<std::size_t>(band));
    }

    void read_window(int band, const PixelWindow& window, std::vector<double>& buffer) override {
        ++read_calls_;
        max_rows_read_ = std::max(max_rows_read_, static_cast<std::size_t>(window.height));
        buffer.resize(window.cell_count());
        const auto& values = list_bands_.at(static_cast<std::size_t>(band));
        std::size_t offset = 0;
        for (int row = window.row_offset; row < window.row_offset + window.height; ++row) {
            for (int col = window.col_offset; col < window.col_offset + window.width; ++col) {
                buffer[offset++] = values.at(index(row, col));
            }
        }
    }

  private:
    [[nodiscard]] std::size_t index(int row, int col) const {
        if (row < 0 || row >= height_ || col < 0 || col >= width_) {
            throw std::out_of_range("pixel outside memory raster");
        }
        return static_cast<std::size_t>(row) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(col);
    }

    std::string str_description_{"memory"};
    int width_;
    int height_;
    GeoTransform geotransform_;
    CrsDescriptor crs_;
    std::vector<std::vector<double>> list_bands_;
    std::vector<std::optional<double>> list_nodata_;
    std::size_t read_calls_{0};
    std::size_t max_rows_read_{0};
};

/** @brief Projected CRS in metres (UTM zone 33N). */
inline CrsDescriptor utm33_crs() {
    CrsDescriptor crs{};
    crs.identifier = "EPSG:32633";
    crs.kind = CrsKind::Projected;
    crs.linear_unit_name = "metre";
    crs.linear_unit_to_m = 1.0;
    return crs;
}

/** @brief 10 m pixels, origin (500000, 4000000), north-up. */
inline GeoTransform ten_metre_grid() {
    return GeoTransform{{500'000.0, 10.0, 0.0, 4'000'000.0, 0.0, -10.0}};
}

/** @brief Axis-aligned rectangle covering map coordinates [x0, x1] x [y0, y1]. */
inline LinearRing rectangle(double x0, double y0, double x1, double y1) {
    return LinearRing{{x0, y0}, {x1, y0}, {x1, y1}, {x0, y1}, {x0, y0}};
}

/**
 * @brief Boundary covering pixel columns [col0, col1) and rows [row0, row1) of `ten_metre_grid`.
 */
inline PolygonShape pixel_block(int col0, int row0, int col1, int row1) {
    const GeoTransform grid = ten_metre_grid();
    const MapPoint top_left = grid.apply(col0, row0);
    const MapPoint bottom_right = grid.apply(col1, row1);
    return PolygonShape{rectangle(top_left.x, bottom_right.y, bottom_right.x, top_left.y), {}};
}

inline BoundaryGeometry named_boundary(std::string name, std::vector<PolygonShape> polygons) {
    return BoundaryGeometry{std::move(name), std::move(polygons)};
}

/**
 * @brief Wall clock that only moves when told to.
 */
class ManualClock final {
  public:
    explicit ManualClock(WallTime start = WallTime{std::chrono::hours{24 * 20'000}})
        : now_(std::make_shared<std::atomic<WallClock::rep>>(start.time_since_epoch().count())) {}

    void advance(WallClock::duration delta) {
        now_->fetch_add(delta.count());
    }

    [[nodiscard]] WallTime now() const {
        return WallTime{WallClock::duration{now_->load()}};
    }

    [[nodiscard]] WallClockSource source() const {
        auto shared_now = now_;
        return [shared_now]() { return WallTime{WallClock::duration{shared_now->load()}}; };
    }

  private:
    std::shared_ptr<std::atomic<WallClock::rep>> now_;
};

/** @brief Fresh empty directory under the system temp directory. */
inline std::filesystem::path make_temp_directory(const std::string& prefix) {
    std::random_device device;
    const auto directory = std::filesystem::temp_directory_path() / (prefix + "_" + std::to_string(device()));
    std::filesystem::remove_all(directory);
    std::filesystem::create_directories(directory);
    return directory;
}

}  // namespace green_coverage::test
