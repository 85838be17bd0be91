// === Boundary Geometry =======================================================
//
// Polygon model for city boundaries and the scanline rasterizer that turns a
// pixel-space polygon set into per-row column spans (pixel-centre rule).

#pragma once

#include <string>
#include <utility>
#include <vector>

#include "green_coverage/spatial_reference.hpp"
#include "green_coverage/types.hpp"

namespace green_coverage {

/** @brief Closed ring of vertices; the closing vertex may be repeated or omitted. */
using LinearRing = std::vector<MapPoint>;

/** @brief Polygon with one exterior ring and zero or more holes. */
struct PolygonShape final {
    LinearRing exterior{};
    std::vector<LinearRing> interiors{};
};

/** @brief Axis-aligned bounding box. */
struct Envelope final {
    double min_x{};
    double min_y{};
    double max_x{};
    double max_y{};
    bool initialized{false};

    void expand(const MapPoint& point) noexcept;
    [[nodiscard]] bool valid() const noexcept { return initialized && min_x <= max_x && min_y <= max_y; }
};

/**
 * @brief One named city boundary (polygon or multipolygon).
 */
struct BoundaryGeometry final {
    std::string name{};
    std::vector<PolygonShape> polygons{};

    [[nodiscard]] Envelope envelope() const noexcept;
};

/**
 * @brief Features of one boundary source sharing a coordinate reference system.
 */
struct BoundaryCollection final {
    CrsDescriptor crs{};
    std::vector<BoundaryGeometry> features{};
};

/**
 * @brief Pixel membership of a polygon set over a raster window.
 *
 * A pixel is inside when its centre lies inside the polygon set under the
 * even-odd rule, so holes are excluded. Spans are half-open `[first, last)`
 * absolute column ranges clipped to the window.
 */
class ScanlineMask final {
  public:
    using Span = std::pair<int, int>;

    /**
     * @brief Rasterize `polygons` (already in pixel coordinates) over `window`.
     */
    ScanlineMask(const std::vector<PolygonShape>& polygons, const PixelWindow& window);

    [[nodiscard]] const PixelWindow& window() const noexcept;
    /** @brief Spans for an absolute raster row; empty outside the window. */
    [[nodiscard]] const std::vector<Span>& spans(int row) const noexcept;
    [[nodiscard]] bool contains(int row, int col) const noexcept;
    /** @brief Number of pixels inside the polygon set within the window. */
    [[nodiscard]] std::size_t pixel_count() const noexcept;

  private:
    PixelWindow window_;
    std::vector<std::vector<Span>> list_row_spans_;
};

}  // namespace green_coverage
