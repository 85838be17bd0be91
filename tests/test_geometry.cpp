#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "green_coverage/geometry.hpp"
#include "test_fixtures.hpp"

using namespace green_coverage;

namespace {

PolygonShape square(double x0, double y0, double x1, double y1) {
    return PolygonShape{test::rectangle(x0, y0, x1, y1), {}};
}

}  // namespace

TEST_CASE("ScanlineMask selects pixels whose centres fall inside the polygon") {
    const ScanlineMask mask{{square(2.0, 3.0, 6.0, 5.0)}, PixelWindow{0, 0, 10, 10}};

    REQUIRE(mask.pixel_count() == 8);
    REQUIRE(mask.contains(3, 2));
    REQUIRE(mask.contains(4, 5));
    REQUIRE_FALSE(mask.contains(4, 6));
    REQUIRE_FALSE(mask.contains(5, 2));
    REQUIRE_FALSE(mask.contains(2, 3));
}

TEST_CASE("ScanlineMask ignores cells whose centre lies outside a partial overlap") {
    // Covers only the left 40% of column 0 and so misses its centre.
    const ScanlineMask mask{{square(0.0, 0.0, 0.4, 2.0)}, PixelWindow{0, 0, 4, 4}};
    REQUIRE(mask.pixel_count() == 0);
}

TEST_CASE("ScanlineMask excludes holes") {
    PolygonShape donut = square(0.0, 0.0, 6.0, 6.0);
    donut.interiors.push_back(test::rectangle(2.0, 2.0, 4.0, 4.0));
    const ScanlineMask mask{{donut}, PixelWindow{0, 0, 6, 6}};

    REQUIRE(mask.pixel_count() == 32);
    REQUIRE_FALSE(mask.contains(2, 2));
    REQUIRE_FALSE(mask.contains(3, 3));
    REQUIRE(mask.contains(1, 1));
}

TEST_CASE("ScanlineMask unions the parts of a multipolygon") {
    const ScanlineMask mask{{square(0.0, 0.0, 2.0, 2.0), square(5.0, 5.0, 7.0, 8.0)}, PixelWindow{0, 0, 10, 10}};

    REQUIRE(mask.pixel_count() == 4 + 6);
    REQUIRE(mask.contains(0, 0));
    REQUIRE(mask.contains(7, 6));
    REQUIRE_FALSE(mask.contains(3, 3));
}

TEST_CASE("ScanlineMask clips spans to its window") {
    const ScanlineMask mask{{square(-5.0, -5.0, 50.0, 50.0)}, PixelWindow{2, 2, 3, 4}};

    REQUIRE(mask.pixel_count() == 12);
    REQUIRE(mask.spans(1).empty());
    REQUIRE(mask.spans(6).empty());
    const auto& spans = mask.spans(3);
    REQUIRE(spans.size() == 1);
    REQUIRE(spans.front().first == 2);
    REQUIRE(spans.front().second == 5);
}

TEST_CASE("ScanlineMask over an empty window selects nothing") {
    const ScanlineMask mask{{square(0.0, 0.0, 5.0, 5.0)}, PixelWindow{0, 0, 0, 5}};
    REQUIRE(mask.pixel_count() == 0);
    REQUIRE_FALSE(mask.contains(1, 1));
}

TEST_CASE("BoundaryGeometry envelope spans every part") {
    const BoundaryGeometry boundary{"Twin", {square(0.0, 0.0, 1.0, 1.0), square(4.0, -2.0, 5.0, 3.0)}};
    const Envelope envelope = boundary.envelope();

    REQUIRE(envelope.valid());
    REQUIRE(envelope.min_x == 0.0);
    REQUIRE(envelope.max_x == 5.0);
    REQUIRE(envelope.min_y == -2.0);
    REQUIRE(envelope.max_y == 3.0);
}

TEST_CASE("GeoTransform inverse round-trips pixel coordinates") {
    const GeoTransform grid = test::ten_metre_grid();
    const auto inverse = grid.inverse();
    REQUIRE(inverse.has_value());

    const MapPoint map = grid.apply(7.0, 3.0);
    const MapPoint pixel = inverse->apply(map.x, map.y);
    REQUIRE(pixel.x == Catch::Approx(7.0));
    REQUIRE(pixel.y == Catch::Approx(3.0));
    REQUIRE(grid.pixel_area() == 100.0);

    const GeoTransform singular{{0.0, 1.0, 2.0, 0.0, 2.0, 4.0}};
    REQUIRE_FALSE(singular.inverse().has_value());
}
