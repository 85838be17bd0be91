// === Configuration ===========================================================
//
// Exposes the strongly-typed configuration consumed across the engine: data
// locations, NDVI defaults, cache lifetimes and scheduler knobs.
// `ConfigurationLoader` translates environment variables into these
// structures so downstream modules never touch `std::getenv` directly.

#pragma once

#include <filesystem>
#include <string>

#include "green_coverage/expiration_policy.hpp"
#include "green_coverage/recompute_scheduler.hpp"

namespace green_coverage {

/**
 * @brief Immutable bundle of runtime knobs for the coverage service.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct Configuration final {
    std::string log_directory{};                 /**< Destination directory for structured logs. */
    std::filesystem::path satellite_directory{}; /**< Multi-band rasters, one or more per city. */
    std::filesystem::path boundary_directory{};  /**< City boundary vector files. */
    std::filesystem::path cache_database{};      /**< SQLite cache file. */
    std::filesystem::path city_file{};           /**< `id,name` list of cities. */
    ExpirationPolicy expiration{};               /**< Cache TTLs per calculation type. */
    SchedulerConfig scheduler{};                 /**< Batch and background settings, including NDVI defaults. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    /**
     * @brief Read `GREEN_COVERAGE_*` variables; relative defaults resolve
     *        against `data_root`.
     */
    static Configuration load(const std::filesystem::path& data_root);

  private:
    static SchedulerConfig load_scheduler();
    static NdviParameters load_ndvi();
    static ExpirationPolicy load_expiration();
};

}  // namespace green_coverage
