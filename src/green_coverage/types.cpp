#include "green_coverage/types.hpp"

#include <cmath>

namespace green_coverage {

WallClockSource system_wall_clock() {
    return []() { return WallClock::now(); };
}

std::int64_t to_epoch_ms(WallTime time) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

WallTime from_epoch_ms(std::int64_t epoch_ms) noexcept {
    return WallTime{std::chrono::duration_cast<WallClock::duration>(std::chrono::milliseconds{epoch_ms})};
}

int utc_year(WallTime time) noexcept {
    const std::chrono::year_month_day date{std::chrono::floor<std::chrono::days>(time)};
    return static_cast<int>(date.year());
}

MapPoint GeoTransform::apply(double col, double row) const noexcept {
    const auto& c = coefficients;
    return MapPoint{c[0] + col * c[1] + row * c[2], c[3] + col * c[4] + row * c[5]};
}

double GeoTransform::pixel_area() const noexcept {
    const auto& c = coefficients;
    return std::abs(c[1] * c[5] - c[2] * c[4]);
}

std::optional<GeoTransform> GeoTransform::inverse() const noexcept {
    const auto& c = coefficients;
    const double det = c[1] * c[5] - c[2] * c[4];
    if (std::abs(det) < 1e-15 || !std::isfinite(det)) {
        return std::nullopt;
    }
    const double inv_det = 1.0 / det;
    GeoTransform result{};
    auto& r = result.coefficients;
    r[1] = c[5] * inv_det;
    r[4] = -c[4] * inv_det;
    r[2] = -c[2] * inv_det;
    r[5] = c[1] * inv_det;
    r[0] = (c[2] * c[3] - c[0] * c[5]) * inv_det;
    r[3] = (-c[1] * c[3] + c[0] * c[4]) * inv_det;
    return result;
}

}  // namespace green_coverage
