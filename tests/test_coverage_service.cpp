#include <chrono>
#include <fstream>
#include <memory>
#include <stdexcept>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "green_coverage/cache_store.hpp"
#include "green_coverage/coverage_service.hpp"
#include "green_coverage/errors.hpp"
#include "gdal_test_files.hpp"
#include "logging_test_fixture.hpp"
#include "test_fixtures.hpp"

using namespace green_coverage;
using namespace std::chrono_literals;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    green_coverage::test::ensure_logger_initialized();
    return true;
}();

/**
 * @brief Service over an in-memory cache and a data directory holding Alpha's
 * raster and boundary.
 */
struct ServiceFixture {
    ServiceFixture()
        : root(test::make_temp_directory("green_coverage_service")),
          store(std::make_shared<SqliteCacheStore>(":memory:")) {
        configuration.satellite_directory = root / "satellite";
        configuration.boundary_directory = root / "shapefiles";
        configuration.scheduler.batch_pause = 0ms;
        configuration.scheduler.retry_delay = 0ms;
        std::filesystem::create_directories(configuration.satellite_directory);
        std::filesystem::create_directories(configuration.boundary_directory);

        raster_path = configuration.satellite_directory / "alpha_2024.tif";
        boundary_path = configuration.boundary_directory / "alpha.geojson";
        test::write_geotiff(raster_path, 4326, test::degree_grid(), 60);
        test::write_geojson(boundary_path, {{"Alpha", test::degree_cells(0, 0, 10, 10)}, {"Beta", test::degree_cells(0, 0, 5, 5)}});

        service = std::make_unique<CoverageService>(
            configuration,
            store,
            std::make_shared<InMemoryCityRegistry>(std::vector<CityRecord>{{1, "Alpha"}, {2, "Beta"}}),
            std::make_shared<DirectoryImageryCatalog>(configuration.satellite_directory, configuration.boundary_directory),
            clock.source()
        );
    }

    ~ServiceFixture() {
        service.reset();
        std::error_code error_cleanup;
        std::filesystem::remove_all(root, error_cleanup);
    }

    CoverageRequest alpha_request() const {
        CoverageRequest request{};
        request.city_name = "Alpha";
        request.city_id = 1;
        request.boundary_path = boundary_path;
        request.raster_path = raster_path;
        return request;
    }

    test::ManualClock clock{};
    std::filesystem::path root;
    Configuration configuration{};
    std::shared_ptr<SqliteCacheStore> store;
    std::filesystem::path raster_path;
    std::filesystem::path boundary_path;
    std::unique_ptr<CoverageService> service;
};

}  // namespace

TEST_CASE("Direct coverage requests are served from the cache") {
    ServiceFixture fixture{};

    const CoverageResult first = fixture.service->compute_coverage(fixture.alpha_request());
    const CoverageResult second = fixture.service->compute_coverage(fixture.alpha_request());

    REQUIRE(first.coverage_percentage == Catch::Approx(60.0));
    REQUIRE(second.coverage_percentage == first.coverage_percentage);
    REQUIRE(first.year == utc_year(fixture.clock.now()));
    REQUIRE(fixture.service->cache_stats().by_type.at("satellite") == 1);
    REQUIRE(fixture.service->cached_cities() == std::vector<std::string>{"Alpha"});
}

TEST_CASE("Replacing the raster invalidates the cached result") {
    ServiceFixture fixture{};
    REQUIRE(fixture.service->compute_coverage(fixture.alpha_request()).coverage_percentage == Catch::Approx(60.0));

    test::write_geotiff(fixture.raster_path, 4326, test::degree_grid(), 30);

    REQUIRE(fixture.service->compute_coverage(fixture.alpha_request()).coverage_percentage == Catch::Approx(30.0));
    REQUIRE(fixture.service->cache_stats().by_type.at("satellite") == 2);
}

TEST_CASE("Parameters other than the defaults produce a separate entry") {
    ServiceFixture fixture{};
    CoverageRequest strict = fixture.alpha_request();
    NdviParameters parameters{};
    parameters.ndvi_threshold = 0.9;
    parameters.year = 2020;
    strict.parameters = parameters;

    REQUIRE(fixture.service->compute_coverage(fixture.alpha_request()).coverage_percentage == Catch::Approx(60.0));
    const CoverageResult result = fixture.service->compute_coverage(strict);
    REQUIRE(result.coverage_percentage == 0.0);
    REQUIRE(result.year == 2020);
    REQUIRE(fixture.service->cache_stats().valid_entries == 2);
}

TEST_CASE("Forced refresh recomputes and overwrites") {
    ServiceFixture fixture{};
    (void)fixture.service->compute_coverage(fixture.alpha_request());

    CoverageRequest refresh = fixture.alpha_request();
    refresh.force_refresh = true;
    REQUIRE(fixture.service->compute_coverage(refresh).coverage_percentage == Catch::Approx(60.0));
    REQUIRE(fixture.service->cache_stats().total_entries == 1);
}

TEST_CASE("Unsupported inputs fail before anything is cached") {
    ServiceFixture fixture{};
    CoverageRequest request = fixture.alpha_request();
    request.raster_path = fixture.root / "alpha.png";

    try {
        (void)fixture.service->compute_coverage(request);
        FAIL("expected UnsupportedFormat");
    } catch (const CoverageError& error) {
        REQUIRE(error.kind() == ErrorKind::UnsupportedFormat);
    }

    request = fixture.alpha_request();
    request.city_name = "Gamma";
    try {
        (void)fixture.service->compute_coverage(request);
        FAIL("expected CityNotFound");
    } catch (const CoverageError& error) {
        REQUIRE(error.kind() == ErrorKind::CityNotFound);
    }
    REQUIRE(fixture.service->cache_stats().total_entries == 0);
}

TEST_CASE("Comparisons come from the latest stored record and are cached") {
    ServiceFixture fixture{};
    int lookups = 0;
    const StoredCoverageSource source = [&lookups]() -> std::optional<StoredCoverage> {
        ++lookups;
        StoredCoverage record{};
        record.city_name = "Beta";
        record.year = 2023;
        record.coverage_percentage = 45.0;
        return record;
    };

    const CoverageComparison first = fixture.service->compare_coverage("beta", source);
    const CoverageComparison second = fixture.service->compare_coverage("Beta", source);

    REQUIRE(lookups == 1);
    REQUIRE(first.city_name == "Beta");
    REQUIRE(first.difference_points == Catch::Approx(15.0));
    REQUIRE(second.comparison_result == first.comparison_result);
    REQUIRE(fixture.service->cache_stats().by_type.at("stats") == 1);
}

TEST_CASE("Comparison failures are reported and not cached") {
    ServiceFixture fixture{};

    try {
        (void)fixture.service->compare_coverage("Atlantis", StoredCoverageSource{});
        FAIL("expected CityNotFound");
    } catch (const CoverageError& error) {
        REQUIRE(error.kind() == ErrorKind::CityNotFound);
    }

    try {
        (void)fixture.service->compare_coverage("Beta", []() { return std::optional<StoredCoverage>{}; });
        FAIL("expected MissingInput");
    } catch (const CoverageError& error) {
        REQUIRE(error.kind() == ErrorKind::MissingInput);
    }
    REQUIRE(fixture.service->cache_stats().total_entries == 0);
}

TEST_CASE("Comparison without a record falls back to satellite analysis") {
    ServiceFixture fixture{};

    const CoverageComparison comparison = fixture.service->compare_coverage("Alpha");

    REQUIRE(comparison.city_coverage_percentage == Catch::Approx(60.0));
    REQUIRE(comparison.comparison_result ==
            "Excellent! Alpha exceeds WHO recommendations by 30.0 percentage points, indicating a very healthy urban environment.");
    const CacheStats stats = fixture.service->cache_stats();
    REQUIRE(stats.by_type.at("satellite") == 1);
    REQUIRE(stats.by_type.at("stats") == 1);
}

TEST_CASE("Batch runs and invalidation go through the service") {
    ServiceFixture fixture{};

    const BatchRunSummary summary = fixture.service->trigger_batch_run(std::string{"Alpha"});
    REQUIRE(summary.status == BatchRunStatus::Completed);
    REQUIRE(summary.succeeded() == 1);
    REQUIRE(summary.outcomes.front().result->coverage_percentage == Catch::Approx(60.0));
    REQUIRE(fixture.service->scheduler_status().last_run.has_value());

    (void)fixture.service->compare_coverage("Alpha");
    REQUIRE(fixture.service->cache_stats().total_entries == 2);
    REQUIRE(fixture.service->invalidate("ALPHA", CalculationType::stats()) == 1);
    REQUIRE(fixture.service->invalidate_all_coverage() == 1);
    REQUIRE(fixture.service->cache_stats().total_entries == 0);
}

TEST_CASE("Service exposes file inspection helpers") {
    ServiceFixture fixture{};

    const BoundarySourceInfo info = fixture.service->describe_boundaries(fixture.boundary_path);
    REQUIRE(info.feature_count == 2);

    const CrsValidationReport report = fixture.service->validate_coordinate_systems(fixture.boundary_path, fixture.raster_path);
    REQUIRE(report.verdict == CrsCompatibility::Compatible);
}

TEST_CASE("An unreachable cache database degrades to direct computation") {
    ServiceFixture fixture{};
    const auto blocker = fixture.root / "not_a_directory";
    {
        std::ofstream stream{blocker};
        stream << "occupied";
    }
    Configuration configuration = fixture.configuration;
    configuration.cache_database = blocker / "cache.db";

    CoverageService degraded{configuration};
    const CoverageResult first = degraded.compute_coverage(fixture.alpha_request());
    const CoverageResult second = degraded.compute_coverage(fixture.alpha_request());
    REQUIRE(first.coverage_percentage == Catch::Approx(60.0));
    REQUIRE(second.coverage_percentage == first.coverage_percentage);

    try {
        static_cast<void>(degraded.cache_stats());
        FAIL("expected CacheUnavailable");
    } catch (const CoverageError& error) {
        REQUIRE(error.kind() == ErrorKind::CacheUnavailable);
    }
}
