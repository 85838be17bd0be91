#include <chrono>
#include <memory>
#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

#include "green_coverage/cache_orchestrator.hpp"
#include "green_coverage/errors.hpp"
#include "logging_test_fixture.hpp"
#include "test_fixtures.hpp"

using namespace green_coverage;
using namespace std::chrono_literals;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    green_coverage::test::ensure_logger_initialized();
    return true;
}();

CacheRequest satellite_request_for(const std::string& city, double threshold) {
    CacheRequest request{};
    request.type = CalculationType::satellite();
    request.city_name = city;
    request.key_params.set("city_name", city).set("ndvi_threshold", threshold);
    return request;
}

CoverageResult coverage_of(const std::string& city, double percentage) {
    CoverageResult result{};
    result.city_name = city;
    result.coverage_percentage = percentage;
    result.total_pixels = 100;
    return result;
}

struct OrchestratorFixture {
    test::ManualClock clock{};
    std::shared_ptr<SqliteCacheStore> store{std::make_shared<SqliteCacheStore>(":memory:")};
    CacheOrchestrator orchestrator{store, ExpirationPolicy{}, clock.source()};
};

}  // namespace

TEST_CASE("A cached result is returned without recomputing") {
    OrchestratorFixture fixture{};
    int computations = 0;
    const auto compute = [&computations]() {
        ++computations;
        return CachePayload{coverage_of("Alpha", 60.0)};
    };
    const CacheRequest request = satellite_request_for("Alpha", 0.3);

    const CachePayload first = fixture.orchestrator.get_or_compute(request, compute);
    fixture.clock.advance(1h);
    const CachePayload second = fixture.orchestrator.get_or_compute(request, compute);

    REQUIRE(computations == 1);
    REQUIRE(std::get<CoverageResult>(second).coverage_percentage == 60.0);
    REQUIRE(std::get<CoverageResult>(second).total_pixels == std::get<CoverageResult>(first).total_pixels);
}

TEST_CASE("An expired entry is recomputed") {
    OrchestratorFixture fixture{};
    int computations = 0;
    const auto compute = [&computations]() {
        ++computations;
        return coverage_of("Alpha", 50.0 + computations);
    };
    const CacheRequest request = satellite_request_for("Alpha", 0.3);

    REQUIRE(fixture.orchestrator.get_or_compute_as<CoverageResult>(request, compute).coverage_percentage == 51.0);
    fixture.clock.advance(fixture.orchestrator.policy().satellite_ttl + 1s);
    REQUIRE(fixture.orchestrator.get_or_compute_as<CoverageResult>(request, compute).coverage_percentage == 52.0);
    REQUIRE(computations == 2);
}

TEST_CASE("A TTL override replaces the policy for one write") {
    OrchestratorFixture fixture{};
    int computations = 0;
    const auto compute = [&computations]() {
        ++computations;
        return CachePayload{compare_with_recommendation("Alpha", 40.0, 2023)};
    };
    CacheRequest request{};
    request.type = CalculationType::stats();
    request.city_name = "Alpha";
    request.key_params.set("city_name", "Alpha").set("operation", "coverage_comparison");
    request.ttl_override = 10min;

    (void)fixture.orchestrator.get_or_compute(request, compute);
    fixture.clock.advance(11min);
    (void)fixture.orchestrator.get_or_compute(request, compute);
    REQUIRE(computations == 2);
}

TEST_CASE("Different parameters are cached independently") {
    OrchestratorFixture fixture{};
    int computations = 0;
    const auto compute = [&computations]() {
        ++computations;
        return CachePayload{coverage_of("Alpha", 60.0)};
    };

    const CacheRequest low = satellite_request_for("Alpha", 0.2);
    const CacheRequest high = satellite_request_for("Alpha", 0.4);
    REQUIRE(fixture.orchestrator.key_for(low) != fixture.orchestrator.key_for(high));

    (void)fixture.orchestrator.get_or_compute(low, compute);
    (void)fixture.orchestrator.get_or_compute(high, compute);
    (void)fixture.orchestrator.get_or_compute(low, compute);
    REQUIRE(computations == 2);
    REQUIRE(fixture.orchestrator.cache_stats().by_type.at("satellite") == 2);
}

TEST_CASE("A failed computation is not cached") {
    OrchestratorFixture fixture{};
    const CacheRequest request = satellite_request_for("Alpha", 0.3);

    REQUIRE_THROWS_AS(fixture.orchestrator.get_or_compute(request, []() -> CachePayload {
        throw CoverageError(ErrorKind::NoValidPixels, "nothing to measure");
    }), CoverageError);
    REQUIRE(fixture.orchestrator.cache_stats().total_entries == 0);

    int computations = 0;
    (void)fixture.orchestrator.get_or_compute(request, [&computations]() {
        ++computations;
        return CachePayload{coverage_of("Alpha", 60.0)};
    });
    REQUIRE(computations == 1);
}

TEST_CASE("A payload of the wrong shape is rejected and not cached") {
    OrchestratorFixture fixture{};
    const CacheRequest request = satellite_request_for("Alpha", 0.3);

    REQUIRE_THROWS_AS(fixture.orchestrator.get_or_compute(request, []() {
        return CachePayload{StoredCoverage{}};
    }), std::invalid_argument);
    REQUIRE(fixture.orchestrator.cache_stats().total_entries == 0);
}

TEST_CASE("A corrupt cached payload is discarded and recomputed") {
    OrchestratorFixture fixture{};
    const CacheRequest request = satellite_request_for("Alpha", 0.3);

    CacheEntry corrupt{};
    corrupt.cache_key = fixture.orchestrator.key_for(request);
    corrupt.calculation_type = CalculationType::satellite();
    corrupt.city_name = "Alpha";
    corrupt.payload = "{truncated";
    corrupt.created_at = fixture.clock.now();
    corrupt.expires_at = fixture.clock.now() + 1h;
    fixture.store->put(corrupt);

    int computations = 0;
    const CoverageResult result = fixture.orchestrator.get_or_compute_as<CoverageResult>(request, [&computations]() {
        ++computations;
        return coverage_of("Alpha", 61.0);
    });

    REQUIRE(computations == 1);
    REQUIRE(result.coverage_percentage == 61.0);
    const auto rewritten = fixture.store->get(corrupt.cache_key, fixture.clock.now());
    REQUIRE(rewritten.has_value());
    REQUIRE(rewritten->payload != corrupt.payload);
}

TEST_CASE("An unavailable store degrades to direct computation") {
    test::ManualClock clock{};
    CacheOrchestrator orchestrator{std::make_shared<UnavailableCacheStore>("database is locked"), ExpirationPolicy{}, clock.source()};
    const CacheRequest request = satellite_request_for("Alpha", 0.3);

    int computations = 0;
    const auto compute = [&computations]() {
        ++computations;
        return CachePayload{coverage_of("Alpha", 60.0)};
    };
    REQUIRE(std::get<CoverageResult>(orchestrator.get_or_compute(request, compute)).coverage_percentage == 60.0);
    REQUIRE(std::get<CoverageResult>(orchestrator.get_or_compute(request, compute)).coverage_percentage == 60.0);
    REQUIRE(computations == 2);

    const RefreshOutcome outcome = orchestrator.refresh(request, compute);
    REQUIRE_FALSE(outcome.cached);
    REQUIRE(outcome.cache_key == orchestrator.key_for(request));
}

TEST_CASE("Refresh overwrites the cached entry") {
    OrchestratorFixture fixture{};
    const CacheRequest request = satellite_request_for("Alpha", 0.3);
    (void)fixture.orchestrator.get_or_compute(request, []() { return CachePayload{coverage_of("Alpha", 40.0)}; });

    const RefreshOutcome outcome = fixture.orchestrator.refresh(request, []() { return CachePayload{coverage_of("Alpha", 45.0)}; });
    REQUIRE(outcome.cached);

    int computations = 0;
    const CoverageResult cached = fixture.orchestrator.get_or_compute_as<CoverageResult>(request, [&computations]() {
        ++computations;
        return coverage_of("Alpha", 0.0);
    });
    REQUIRE(computations == 0);
    REQUIRE(cached.coverage_percentage == 45.0);
}

TEST_CASE("Invalidation removes a city's entries by type") {
    OrchestratorFixture fixture{};
    (void)fixture.orchestrator.get_or_compute(satellite_request_for("Alpha", 0.3), []() { return CachePayload{coverage_of("Alpha", 40.0)}; });
    (void)fixture.orchestrator.get_or_compute(satellite_request_for("Beta", 0.3), []() { return CachePayload{coverage_of("Beta", 40.0)}; });

    CacheRequest comparison{};
    comparison.type = CalculationType::stats();
    comparison.city_name = "Alpha";
    comparison.key_params.set("city_name", "Alpha").set("operation", "coverage_comparison");
    (void)fixture.orchestrator.get_or_compute(comparison, []() {
        return CachePayload{compare_with_recommendation("Alpha", 40.0, 2023)};
    });

    REQUIRE(fixture.orchestrator.invalidate("alpha", CalculationType::stats()) == 1);
    REQUIRE(fixture.orchestrator.invalidate("Alpha") == 1);
    REQUIRE(fixture.orchestrator.cached_cities() == std::vector<std::string>{"Beta"});
    REQUIRE(fixture.orchestrator.invalidate_types({CalculationType::satellite()}) == 1);
}

TEST_CASE("Sweeping removes entries past their expiry") {
    OrchestratorFixture fixture{};
    (void)fixture.orchestrator.get_or_compute(satellite_request_for("Alpha", 0.3), []() { return CachePayload{coverage_of("Alpha", 40.0)}; });
    CacheRequest comparison{};
    comparison.type = CalculationType::stats();
    comparison.city_name = "Beta";
    comparison.key_params.set("city_name", "Beta");
    (void)fixture.orchestrator.get_or_compute(comparison, []() {
        return CachePayload{compare_with_recommendation("Beta", 20.0, 2023)};
    });

    fixture.clock.advance(fixture.orchestrator.policy().stats_ttl + 1s);
    const CacheStats stats = fixture.orchestrator.cache_stats();
    REQUIRE(stats.valid_entries == 1);
    REQUIRE(stats.expired_entries == 1);
    REQUIRE(fixture.orchestrator.sweep_expired() == 1);
    REQUIRE(fixture.orchestrator.cache_stats().total_entries == 1);
}

TEST_CASE("Expiration policy resolves custom tags") {
    ExpirationPolicy policy{};
    policy.custom_ttls["tree_canopy"] = 2h;

    REQUIRE(policy.ttl_for(CalculationType::satellite()) == 72h);
    REQUIRE(policy.ttl_for(CalculationType::stats()) == 12h);
    REQUIRE(policy.ttl_for(CalculationType::stored()) == 24h);
    REQUIRE(policy.ttl_for(CalculationType::custom("tree_canopy")) == 2h);
    REQUIRE(policy.ttl_for(CalculationType::custom("other")) == 24h);
}
