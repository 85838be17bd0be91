// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs used throughout the
// engine (clock primitives, affine geotransforms, pixel windows).

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

namespace green_coverage {

/**
 * @brief Alias for the steady clock used for deadlines and run budgets.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for timestamps captured from the steady clock.
 */
using TimePoint = std::chrono::time_point<SteadyClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Wall clock used for cache timestamps and schedule computation.
 */
using WallClock = std::chrono::system_clock;

/**
 * @brief Alias for wall-clock timestamps.
 */
using WallTime = std::chrono::time_point<WallClock>;

/**
 * @brief Injectable source of wall-clock time; tests substitute a manual clock.
 */
using WallClockSource = std::function<WallTime()>;

/** @brief Clock source backed by `std::chrono::system_clock`. */
WallClockSource system_wall_clock();

/** @brief Milliseconds since the Unix epoch for persistence. */
[[nodiscard]] std::int64_t to_epoch_ms(WallTime time) noexcept;

/** @brief Inverse of `to_epoch_ms`. */
[[nodiscard]] WallTime from_epoch_ms(std::int64_t epoch_ms) noexcept;

/** @brief Calendar year of `time` in UTC. */
[[nodiscard]] int utc_year(WallTime time) noexcept;

/**
 * @brief Projected map coordinate (x = easting/longitude, y = northing/latitude).
 */
struct MapPoint final {
    double x{};
    double y{};
};

/**
 * @brief Six-term affine transform mapping pixel/line to map coordinates.
 *
 * Uses the GDAL convention: `x = c[0] + col * c[1] + row * c[2]` and
 * `y = c[3] + col * c[4] + row * c[5]`.
 */
struct GeoTransform final {
    std::array<double, 6> coefficients{0.0, 1.0, 0.0, 0.0, 0.0, 1.0};

    /** @brief Map a (column, row) pixel-space location to map coordinates. */
    [[nodiscard]] MapPoint apply(double col, double row) const noexcept;

    /** @brief Area of one pixel in squared map units (|determinant|). */
    [[nodiscard]] double pixel_area() const noexcept;

    /** @brief Inverse transform; empty when the matrix is singular. */
    [[nodiscard]] std::optional<GeoTransform> inverse() const noexcept;
};

/**
 * @brief Rectangular block of raster cells addressed by offset and size.
 */
struct PixelWindow final {
    int col_offset{};
    int row_offset{};
    int width{};
    int height{};

    [[nodiscard]] bool empty() const noexcept { return width <= 0 || height <= 0; }
    [[nodiscard]] std::size_t cell_count() const noexcept {
        return empty() ? 0 : static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    }
};

}  // namespace green_coverage
