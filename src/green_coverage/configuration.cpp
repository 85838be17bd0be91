// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings that feed
// the coverage service. This implementation provides a narrow interface
// (`ConfigurationLoader`) that transforms raw environment variables into the
// strongly-typed `Configuration` structure consumed by downstream modules.
//
// Responsibilities
// - Enforce defaults and bounds for NDVI analysis, cache lifetimes, batch
//   sizing and the weekly/daily schedule.
// - Surface clear diagnostics via the logging subsystem whenever user input
//   cannot be parsed or falls outside its range.
// - Shield the rest of the codebase from `std::getenv` lookups by returning a
//   fully-populated configuration object.
//
// External dependencies
// - `<cstdlib>` for environment access.
// - `green_coverage/logging.hpp` to emit structured warnings.
//
// Note: This file never reads from disk; callers are expected to populate the
// process environment ahead of time (systemd unit, container env, `.env`).

#include "green_coverage/configuration.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string_view>

#include "green_coverage/logging.hpp"

namespace green_coverage {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr char k_default_satellite_subdir[] = "data/satellite";
constexpr char k_default_boundary_subdir[] = "data/shapefiles";
constexpr char k_default_cache_file[] = "green_coverage_cache.db";
constexpr char k_default_city_file[] = "cities.csv";
constexpr double k_default_ndvi_threshold{0.3};
constexpr int k_default_satellite_ttl_hours{72};
constexpr int k_default_stats_ttl_hours{12};
constexpr int k_default_ttl_hours{24};

const char* env(const char* name) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return nullptr;
    }
    return raw_value;
}

double parse_double(const char* name, double fallback, double min_value, double max_value) {
    const char* raw_value = env(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (parsed_value < min_value || parsed_value > max_value) {
            get_logger()->warn("{}={} is outside [{}, {}]; using fallback {}", name, raw_value, min_value, max_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse double from {}; using fallback {}", name, fallback);
        return fallback;
    }
}

int parse_int(const char* name, int fallback, int min_value, int max_value) {
    const char* raw_value = env(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        if (parsed_value < min_value || parsed_value > max_value) {
            get_logger()->warn("{}={} is outside [{}, {}]; using fallback {}", name, raw_value, min_value, max_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse integer from {}; using fallback {}", name, fallback);
        return fallback;
    }
}

bool parse_bool(const char* name, bool fallback) {
    const char* raw_value = env(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    std::string lowered{raw_value};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    get_logger()->warn("Failed to parse boolean from {}; using fallback {}", name, fallback);
    return fallback;
}

std::filesystem::path parse_path(const char* name, const std::filesystem::path& fallback) {
    const char* raw_value = env(name);
    return raw_value == nullptr ? fallback : std::filesystem::path{raw_value};
}

std::string parse_log_directory() {
    const char* raw_directory = env("GREEN_COVERAGE_LOG_DIR");
    return raw_directory == nullptr ? std::string{k_default_log_directory} : std::string{raw_directory};
}

}  // namespace

Configuration ConfigurationLoader::load(const std::filesystem::path& data_root) {
    Configuration config{};
    config.log_directory = parse_log_directory();

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.satellite_directory = parse_path("GREEN_COVERAGE_SATELLITE_DIR", data_root / k_default_satellite_subdir);
    config.boundary_directory = parse_path("GREEN_COVERAGE_SHAPEFILE_DIR", data_root / k_default_boundary_subdir);
    config.cache_database = parse_path("GREEN_COVERAGE_CACHE_DB", data_root / k_default_cache_file);
    config.city_file = parse_path("GREEN_COVERAGE_CITY_FILE", data_root / k_default_city_file);
    config.expiration = load_expiration();
    config.scheduler = load_scheduler();

    logger->info("Configuration loaded: satellite_dir={} shapefile_dir={} cache_db={} ndvi_threshold={} batch_size={} weekly=day{}@{:02}:{:02}",
                 config.satellite_directory.string(),
                 config.boundary_directory.string(),
                 config.cache_database.string(),
                 config.scheduler.ndvi.ndvi_threshold,
                 config.scheduler.batch_size,
                 config.scheduler.weekly.day_of_week,
                 config.scheduler.weekly.hour,
                 config.scheduler.weekly.minute);
    return config;
}

NdviParameters ConfigurationLoader::load_ndvi() {
    NdviParameters ndvi{};
    ndvi.ndvi_threshold = parse_double("GREEN_COVERAGE_NDVI_THRESHOLD", k_default_ndvi_threshold, -1.0, 1.0);
    ndvi.red_band_index = parse_int("GREEN_COVERAGE_RED_BAND", ndvi.red_band_index, 0, 255);
    ndvi.nir_band_index = parse_int("GREEN_COVERAGE_NIR_BAND", ndvi.nir_band_index, 0, 255);
    ndvi.tile_rows = parse_int("GREEN_COVERAGE_TILE_ROWS", ndvi.tile_rows, 1, 65'536);
    if (const char* name_field = env("GREEN_COVERAGE_NAME_FIELD"); name_field != nullptr) {
        ndvi.name_field = name_field;
    }
    return ndvi;
}

SchedulerConfig ConfigurationLoader::load_scheduler() {
    SchedulerConfig scheduler{};
    scheduler.enabled = parse_bool("GREEN_COVERAGE_ENABLE_BACKGROUND_TASKS", scheduler.enabled);
    scheduler.weekly.day_of_week = parse_int("GREEN_COVERAGE_WEEKLY_UPDATE_DAY", scheduler.weekly.day_of_week, 0, 6);
    scheduler.weekly.hour = parse_int("GREEN_COVERAGE_WEEKLY_UPDATE_HOUR", scheduler.weekly.hour, 0, 23);
    scheduler.weekly.minute = parse_int("GREEN_COVERAGE_WEEKLY_UPDATE_MINUTE", scheduler.weekly.minute, 0, 59);
    scheduler.cleanup_hour = parse_int("GREEN_COVERAGE_CACHE_CLEANUP_HOUR", scheduler.cleanup_hour, 0, 23);
    scheduler.batch_size = static_cast<std::size_t>(
        parse_int("GREEN_COVERAGE_BATCH_SIZE", static_cast<int>(scheduler.batch_size), 1, 10'000));
    scheduler.max_concurrent_analyses = static_cast<std::size_t>(
        parse_int("GREEN_COVERAGE_MAX_CONCURRENT_UPDATES", static_cast<int>(scheduler.max_concurrent_analyses), 1, 64));
    scheduler.run_budget = std::chrono::seconds{parse_int("GREEN_COVERAGE_MAX_PROCESSING_TIME", 3600, 1, 7 * 24 * 3600)};
    scheduler.compute_timeout = std::chrono::seconds{parse_int("GREEN_COVERAGE_COMPUTE_TIMEOUT", 1800, 1, 24 * 3600)};
    scheduler.batch_pause = std::chrono::milliseconds{parse_int("GREEN_COVERAGE_BATCH_PAUSE_MS", 5000, 0, 3'600'000)};
    scheduler.max_retries = parse_int("GREEN_COVERAGE_MAX_RETRIES", scheduler.max_retries, 0, 10);
    scheduler.retry_delay = std::chrono::seconds{parse_int("GREEN_COVERAGE_RETRY_DELAY", 300, 0, 24 * 3600)};
    scheduler.ndvi = load_ndvi();
    return scheduler;
}

ExpirationPolicy ConfigurationLoader::load_expiration() {
    ExpirationPolicy policy{};
    policy.satellite_ttl = std::chrono::hours{
        parse_int("GREEN_COVERAGE_SATELLITE_TTL_HOURS", k_default_satellite_ttl_hours, 1, 24 * 365)};
    policy.stats_ttl = std::chrono::hours{
        parse_int("GREEN_COVERAGE_STATS_TTL_HOURS", k_default_stats_ttl_hours, 1, 24 * 365)};
    policy.default_ttl = std::chrono::hours{
        parse_int("GREEN_COVERAGE_DEFAULT_TTL_HOURS", k_default_ttl_hours, 1, 24 * 365)};
    return policy;
}

}  // namespace green_coverage
