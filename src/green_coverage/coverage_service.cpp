#include "green_coverage/coverage_service.hpp"

#include <stdexcept>
#include <utility>

#include "green_coverage/cache_store.hpp"
#include "green_coverage/coverage_requests.hpp"
#include "green_coverage/errors.hpp"
#include "green_coverage/logging.hpp"

namespace green_coverage {

namespace {

constexpr char k_satellite_data_source[] = "Satellite Analysis";

CityRegistryPtr make_registry(const std::filesystem::path& city_file) {
    std::error_code error_exists;
    if (!std::filesystem::exists(city_file, error_exists)) {
        get_logger()->warn("City list {} not found; scheduled runs will have no cities", city_file.string());
        return std::make_shared<InMemoryCityRegistry>(std::vector<CityRecord>{});
    }
    return InMemoryCityRegistry::from_file(city_file);
}

CacheStorePtr open_cache_store(const std::filesystem::path& database_path) {
    try {
        return std::make_shared<SqliteCacheStore>(database_path.string());
    } catch (const CoverageError& exc) {
        if (exc.kind() != ErrorKind::CacheUnavailable) {
            throw;
        }
        log_event(spdlog::level::warn, "cache", "degraded", {{"operation", "open"}, {"error", exc.what()}});
        return std::make_shared<UnavailableCacheStore>(exc.what());
    }
}

}  // namespace

CoverageService::CoverageService(Configuration configuration)
    : CoverageService(
          configuration,
          open_cache_store(configuration.cache_database),
          make_registry(configuration.city_file),
          std::make_shared<DirectoryImageryCatalog>(configuration.satellite_directory, configuration.boundary_directory)
      ) {}

CoverageService::CoverageService(Configuration configuration,
                                 CacheStorePtr store,
                                 CityRegistryPtr registry,
                                 ImageryCatalogPtr catalog,
                                 WallClockSource clock)
    : configuration_(std::move(configuration)),
      clock_(clock ? std::move(clock) : system_wall_clock()),
      logger_(get_logger()),
      analyzer_(std::make_shared<CoverageAnalyzer>(gdal_transform_factory())),
      orchestrator_(std::make_shared<CacheOrchestrator>(std::move(store), configuration_.expiration, clock_)),
      registry_(std::move(registry)),
      catalog_(std::move(catalog)) {
    std::shared_ptr<CoverageAnalyzer> analyzer = analyzer_;
    CoverageJob job = [analyzer](const CityRecord& city,
                                 const CityDataFiles& files,
                                 const NdviParameters& parameters,
                                 TimePoint deadline) {
        return analyzer->compute_coverage_from_files(files.boundary_path, files.raster_path, city.name, parameters, deadline);
    };
    scheduler_ = std::make_unique<RecomputeScheduler>(
        configuration_.scheduler, registry_, catalog_, orchestrator_, std::move(job), clock_
    );
}

CoverageService::~CoverageService() {
    shutdown();
}

NdviParameters CoverageService::resolve_parameters(const std::optional<NdviParameters>& parameters) const {
    NdviParameters resolved = parameters.value_or(configuration_.scheduler.ndvi);
    if (!resolved.year.has_value()) {
        resolved.year = utc_year(clock_());
    }
    return resolved;
}

CityRecord CoverageService::require_city(const std::string& city_name) const {
    const std::optional<CityRecord> city = registry_->find_city(city_name);
    if (!city.has_value()) {
        throw CoverageError(ErrorKind::CityNotFound, "City '" + city_name + "' not found");
    }
    return city.value();
}

CoverageResult CoverageService::compute_coverage(const CoverageRequest& request) {
    if (request.city_name.empty()) {
        throw std::invalid_argument("City name must not be empty");
    }
    validate_boundary_extension(request.boundary_path);
    validate_raster_extension(request.raster_path);

    const NdviParameters parameters = resolve_parameters(request.parameters);
    const CacheRequest cache_request = satellite_request(
        request.city_name, request.city_id, request.raster_path, request.boundary_path, parameters
    );
    const auto timeout = configuration_.scheduler.compute_timeout;
    const std::shared_ptr<CoverageAnalyzer> analyzer = analyzer_;
    const ComputeFn compute = [analyzer, &request, &parameters, timeout]() {
        return CachePayload{analyzer->compute_coverage_from_files(
            request.boundary_path, request.raster_path, request.city_name, parameters, SteadyClock::now() + timeout
        )};
    };

    if (request.force_refresh) {
        RefreshOutcome refreshed = orchestrator_->refresh(cache_request, compute);
        return std::get<CoverageResult>(std::move(refreshed.payload));
    }
    return std::get<CoverageResult>(orchestrator_->get_or_compute(cache_request, compute));
}

CachePayload CoverageService::get_or_compute(const CacheRequest& request, const ComputeFn& compute) {
    return orchestrator_->get_or_compute(request, compute);
}

CoverageComparison CoverageService::compare_coverage(const std::string& city_name, const StoredCoverageSource& latest_record) {
    const CityRecord city = require_city(city_name);
    return orchestrator_->get_or_compute_as<CoverageComparison>(
        comparison_request(city.name, city.id),
        [&city, &latest_record]() {
            const std::optional<StoredCoverage> record = latest_record ? latest_record() : std::nullopt;
            if (!record.has_value()) {
                throw CoverageError(ErrorKind::MissingInput, "No green coverage data found for city '" + city.name + "'");
            }
            return compare_with_recommendation(city.name, record->coverage_percentage, record->year);
        }
    );
}

CoverageComparison CoverageService::compare_coverage(const std::string& city_name) {
    const CityRecord city = require_city(city_name);
    return compare_coverage(city.name, [this, &city]() -> std::optional<StoredCoverage> {
        const std::optional<CityDataFiles> files = catalog_->locate(city);
        if (!files.has_value()) {
            return std::nullopt;
        }
        CoverageRequest request{};
        request.city_name = city.name;
        request.city_id = city.id;
        request.boundary_path = files->boundary_path;
        request.raster_path = files->raster_path;
        return to_stored_coverage(compute_coverage(request), k_satellite_data_source);
    });
}

std::size_t CoverageService::invalidate(const std::string& city_name, const std::optional<CalculationType>& type) {
    return orchestrator_->invalidate(city_name, type);
}

std::size_t CoverageService::invalidate_all_coverage() {
    return orchestrator_->invalidate_types({CalculationType::satellite(), CalculationType::stats()});
}

std::size_t CoverageService::sweep_expired() {
    return orchestrator_->sweep_expired();
}

CacheStats CoverageService::cache_stats() {
    return orchestrator_->cache_stats();
}

std::vector<std::string> CoverageService::cached_cities() {
    return orchestrator_->cached_cities();
}

BatchRunSummary CoverageService::trigger_batch_run(const std::optional<std::string>& city_name) {
    return scheduler_->trigger_batch_run(city_name);
}

SchedulerStatus CoverageService::scheduler_status() const {
    return scheduler_->status();
}

BoundarySourceInfo CoverageService::describe_boundaries(const std::filesystem::path& boundary_path) const {
    return green_coverage::describe_boundaries(boundary_path);
}

CrsValidationReport CoverageService::validate_coordinate_systems(const std::filesystem::path& boundary_path,
                                                                 const std::filesystem::path& raster_path) const {
    return green_coverage::validate_coordinate_systems(boundary_path, raster_path);
}

void CoverageService::start() {
    if (flag_running_.exchange(true)) {
        return;
    }
    logger_->info("Starting coverage service");
    scheduler_->start();
}

void CoverageService::shutdown() {
    if (!flag_running_.exchange(false)) {
        return;
    }
    logger_->info("Shutting down coverage service");
    scheduler_->stop();
}

}  // namespace green_coverage
