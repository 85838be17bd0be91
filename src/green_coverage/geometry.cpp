#include "green_coverage/geometry.hpp"

#include <algorithm>
#include <cmath>

namespace green_coverage {

namespace {

const std::vector<ScanlineMask::Span> k_empty_spans{};

void collect_crossings(const LinearRing& ring, double y, std::vector<double>& crossings) {
    const std::size_t count = ring.size();
    if (count < 3) {
        return;
    }
    for (std::size_t index = 0; index < count; ++index) {
        const MapPoint& p = ring[index];
        const MapPoint& q = ring[(index + 1) % count];
        // Half-open rule: a vertex on the scanline is counted once.
        if ((p.y <= y) == (q.y <= y)) {
            continue;
        }
        crossings.push_back(p.x + (y - p.y) * (q.x - p.x) / (q.y - p.y));
    }
}

}  // namespace

void Envelope::expand(const MapPoint& point) noexcept {
    if (!initialized) {
        min_x = max_x = point.x;
        min_y = max_y = point.y;
        initialized = true;
        return;
    }
    min_x = std::min(min_x, point.x);
    max_x = std::max(max_x, point.x);
    min_y = std::min(min_y, point.y);
    max_y = std::max(max_y, point.y);
}

Envelope BoundaryGeometry::envelope() const noexcept {
    Envelope envelope{};
    for (const PolygonShape& polygon : polygons) {
        for (const MapPoint& point : polygon.exterior) {
            envelope.expand(point);
        }
    }
    return envelope;
}

ScanlineMask::ScanlineMask(const std::vector<PolygonShape>& polygons, const PixelWindow& window)
    : window_(window) {
    if (window_.empty()) {
        return;
    }
    list_row_spans_.resize(static_cast<std::size_t>(window_.height));
    const int first_col = window_.col_offset;
    const int end_col = window_.col_offset + window_.width;

    std::vector<double> crossings;
    for (int row_index = 0; row_index < window_.height; ++row_index) {
        const double y = static_cast<double>(window_.row_offset + row_index) + 0.5;
        crossings.clear();
        for (const PolygonShape& polygon : polygons) {
            collect_crossings(polygon.exterior, y, crossings);
            for (const LinearRing& hole : polygon.interiors) {
                collect_crossings(hole, y, crossings);
            }
        }
        std::sort(crossings.begin(), crossings.end());

        auto& row_spans = list_row_spans_[static_cast<std::size_t>(row_index)];
        for (std::size_t index = 0; index + 1 < crossings.size(); index += 2) {
            // Column c is inside when c + 0.5 lies in [x_enter, x_exit).
            const double enter = std::clamp(std::ceil(crossings[index] - 0.5), double(first_col), double(end_col));
            const double exit = std::clamp(std::ceil(crossings[index + 1] - 0.5), double(first_col), double(end_col));
            const int span_first = static_cast<int>(enter);
            const int span_last = static_cast<int>(exit);
            if (span_first < span_last) {
                row_spans.emplace_back(span_first, span_last);
            }
        }
    }
}

const PixelWindow& ScanlineMask::window() const noexcept {
    return window_;
}

const std::vector<ScanlineMask::Span>& ScanlineMask::spans(int row) const noexcept {
    const int row_index = row - window_.row_offset;
    if (row_index < 0 || row_index >= static_cast<int>(list_row_spans_.size())) {
        return k_empty_spans;
    }
    return list_row_spans_[static_cast<std::size_t>(row_index)];
}

bool ScanlineMask::contains(int row, int col) const noexcept {
    for (const auto& [first, last] : spans(row)) {
        if (col >= first && col < last) {
            return true;
        }
    }
    return false;
}

std::size_t ScanlineMask::pixel_count() const noexcept {
    std::size_t total = 0;
    for (const auto& row_spans : list_row_spans_) {
        for (const auto& [first, last] : row_spans) {
            total += static_cast<std::size_t>(last - first);
        }
    }
    return total;
}

}  // namespace green_coverage
