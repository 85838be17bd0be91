// === Coverage Service ========================================================
//
// Outward interface of the engine. Wires configuration, the cache store and
// orchestrator, the analyzer, the city registry, the imagery catalog and the
// recompute scheduler together, and owns the background threads.

#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "green_coverage/cache_orchestrator.hpp"
#include "green_coverage/city_registry.hpp"
#include "green_coverage/configuration.hpp"
#include "green_coverage/coverage_assessment.hpp"
#include "green_coverage/gdal_sources.hpp"
#include "green_coverage/ndvi_analyzer.hpp"
#include "green_coverage/recompute_scheduler.hpp"

namespace green_coverage {

/**
 * @brief Direct coverage request for one city and one pair of input files.
 */
struct CoverageRequest final {
    std::string city_name{};
    std::filesystem::path boundary_path{};
    std::filesystem::path raster_path{};
    std::optional<NdviParameters> parameters{}; /**< Configured defaults when empty. */
    std::optional<std::int64_t> city_id{};
    bool force_refresh{false};                  /**< Recompute even on a cache hit. */
};

/** @brief Supplies the most recent stored coverage of a city, if any. */
using StoredCoverageSource = std::function<std::optional<StoredCoverage>()>;

class CoverageService final {
  public:
    /** @brief Build production collaborators from `configuration`. */
    explicit CoverageService(Configuration configuration);

    /** @brief Build with explicit collaborators. */
    CoverageService(Configuration configuration,
                    CacheStorePtr store,
                    CityRegistryPtr registry,
                    ImageryCatalogPtr catalog,
                    WallClockSource clock = system_wall_clock());

    ~CoverageService();

    CoverageService(const CoverageService&) = delete;
    CoverageService& operator=(const CoverageService&) = delete;

    /** @brief Cached NDVI coverage; the key includes digests of both files. */
    [[nodiscard]] CoverageResult compute_coverage(const CoverageRequest& request);

    /** @brief Generic cache-or-compute for caller-defined computations. */
    CachePayload get_or_compute(const CacheRequest& request, const ComputeFn& compute);

    /** @brief Cached WHO comparison using `latest_record` on a miss. */
    [[nodiscard]] CoverageComparison compare_coverage(const std::string& city_name, const StoredCoverageSource& latest_record);

    /** @brief Cached WHO comparison backed by a satellite analysis of the city's catalog files. */
    [[nodiscard]] CoverageComparison compare_coverage(const std::string& city_name);

    std::size_t invalidate(const std::string& city_name, const std::optional<CalculationType>& type = std::nullopt);
    /** @brief Drop every satellite and stats entry. */
    std::size_t invalidate_all_coverage();
    std::size_t sweep_expired();
    [[nodiscard]] CacheStats cache_stats();
    [[nodiscard]] std::vector<std::string> cached_cities();

    BatchRunSummary trigger_batch_run(const std::optional<std::string>& city_name = std::nullopt);
    [[nodiscard]] SchedulerStatus scheduler_status() const;

    [[nodiscard]] BoundarySourceInfo describe_boundaries(const std::filesystem::path& boundary_path) const;
    [[nodiscard]] CrsValidationReport validate_coordinate_systems(const std::filesystem::path& boundary_path,
                                                                  const std::filesystem::path& raster_path) const;

    /** @brief Start background recomputation and cleanup. */
    void start();
    /** @brief Stop background threads. */
    void shutdown();

  private:
    [[nodiscard]] NdviParameters resolve_parameters(const std::optional<NdviParameters>& parameters) const;
    [[nodiscard]] CityRecord require_city(const std::string& city_name) const;

    Configuration configuration_;
    WallClockSource clock_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<CoverageAnalyzer> analyzer_;
    std::shared_ptr<CacheOrchestrator> orchestrator_;
    CityRegistryPtr registry_;
    ImageryCatalogPtr catalog_;
    std::unique_ptr<RecomputeScheduler> scheduler_;
    std::atomic<bool> flag_running_{false};
};

}  // namespace green_coverage
