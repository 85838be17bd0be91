#include <chrono>
#include <cstdlib>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "green_coverage/configuration.hpp"
#include "logging_test_fixture.hpp"

using namespace green_coverage;
using namespace std::chrono_literals;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    green_coverage::test::ensure_logger_initialized();
    return true;
}();

/**
 * @brief Sets environment variables for one test and unsets them afterwards.
 */
class ScopedEnvironment final {
  public:
    ScopedEnvironment& set(const std::string& name, const std::string& value) {
        ::setenv(name.c_str(), value.c_str(), 1);
        list_names_.push_back(name);
        return *this;
    }

    ~ScopedEnvironment() {
        for (const std::string& name : list_names_) {
            ::unsetenv(name.c_str());
        }
    }

  private:
    std::vector<std::string> list_names_;
};

}  // namespace

TEST_CASE("ConfigurationLoader applies defaults under the data root") {
    const Configuration config = ConfigurationLoader::load("/srv/green");

    REQUIRE(config.satellite_directory == std::filesystem::path{"/srv/green/data/satellite"});
    REQUIRE(config.boundary_directory == std::filesystem::path{"/srv/green/data/shapefiles"});
    REQUIRE(config.cache_database == std::filesystem::path{"/srv/green/green_coverage_cache.db"});
    REQUIRE(config.city_file == std::filesystem::path{"/srv/green/cities.csv"});
    REQUIRE(config.scheduler.ndvi.ndvi_threshold == 0.3);
    REQUIRE(config.scheduler.weekly.day_of_week == 6);
    REQUIRE(config.scheduler.weekly.hour == 2);
    REQUIRE(config.scheduler.cleanup_hour == 3);
    REQUIRE(config.scheduler.batch_size == 10);
    REQUIRE(config.scheduler.max_concurrent_analyses == 2);
    REQUIRE(config.scheduler.run_budget == 3600s);
    REQUIRE(config.scheduler.compute_timeout == 1800s);
    REQUIRE(config.expiration.satellite_ttl == 72h);
    REQUIRE(config.expiration.stats_ttl == 12h);
    REQUIRE(config.expiration.default_ttl == 24h);
}

TEST_CASE("ConfigurationLoader reads overrides from the environment") {
    ScopedEnvironment environment{};
    environment.set("GREEN_COVERAGE_SATELLITE_DIR", "/imagery")
        .set("GREEN_COVERAGE_NDVI_THRESHOLD", "0.45")
        .set("GREEN_COVERAGE_RED_BAND", "2")
        .set("GREEN_COVERAGE_NIR_BAND", "3")
        .set("GREEN_COVERAGE_NAME_FIELD", "CITY")
        .set("GREEN_COVERAGE_ENABLE_BACKGROUND_TASKS", "off")
        .set("GREEN_COVERAGE_WEEKLY_UPDATE_DAY", "0")
        .set("GREEN_COVERAGE_WEEKLY_UPDATE_MINUTE", "45")
        .set("GREEN_COVERAGE_BATCH_SIZE", "4")
        .set("GREEN_COVERAGE_MAX_PROCESSING_TIME", "120")
        .set("GREEN_COVERAGE_BATCH_PAUSE_MS", "0")
        .set("GREEN_COVERAGE_STATS_TTL_HOURS", "6");

    const Configuration config = ConfigurationLoader::load("/srv/green");

    REQUIRE(config.satellite_directory == std::filesystem::path{"/imagery"});
    REQUIRE(config.scheduler.ndvi.ndvi_threshold == 0.45);
    REQUIRE(config.scheduler.ndvi.red_band_index == 2);
    REQUIRE(config.scheduler.ndvi.nir_band_index == 3);
    REQUIRE(config.scheduler.ndvi.name_field == "CITY");
    REQUIRE_FALSE(config.scheduler.enabled);
    REQUIRE(config.scheduler.weekly.day_of_week == 0);
    REQUIRE(config.scheduler.weekly.minute == 45);
    REQUIRE(config.scheduler.batch_size == 4);
    REQUIRE(config.scheduler.run_budget == 120s);
    REQUIRE(config.scheduler.batch_pause == 0ms);
    REQUIRE(config.expiration.stats_ttl == 6h);
}

TEST_CASE("ConfigurationLoader falls back on malformed or out-of-range values") {
    ScopedEnvironment environment{};
    environment.set("GREEN_COVERAGE_NDVI_THRESHOLD", "1.7")
        .set("GREEN_COVERAGE_WEEKLY_UPDATE_HOUR", "25")
        .set("GREEN_COVERAGE_BATCH_SIZE", "lots")
        .set("GREEN_COVERAGE_ENABLE_BACKGROUND_TASKS", "maybe")
        .set("GREEN_COVERAGE_MAX_CONCURRENT_UPDATES", "0");

    const Configuration config = ConfigurationLoader::load("/srv/green");

    REQUIRE(config.scheduler.ndvi.ndvi_threshold == 0.3);
    REQUIRE(config.scheduler.weekly.hour == 2);
    REQUIRE(config.scheduler.batch_size == 10);
    REQUIRE(config.scheduler.enabled);
    REQUIRE(config.scheduler.max_concurrent_analyses == 2);
}
