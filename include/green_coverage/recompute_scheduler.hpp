// === Recompute Scheduler =====================================================
//
// Periodic and on-demand recomputation of coverage for every city with
// imagery. Cities are processed in fixed-size batches by a small worker pool;
// each city's failure is caught and recorded without stopping the run, and an
// overall time budget stops new work once exhausted. Two background threads
// drive the weekly recomputation and the daily expired-entry sweep.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/logger.h>

#include "green_coverage/cache_orchestrator.hpp"
#include "green_coverage/city_registry.hpp"
#include "green_coverage/errors.hpp"
#include "green_coverage/ndvi_analyzer.hpp"
#include "green_coverage/types.hpp"

namespace green_coverage {

/**
 * @brief Weekly trigger in UTC. Days run 0 = Monday through 6 = Sunday.
 */
struct WeeklySchedule final {
    int day_of_week{6};
    int hour{2};
    int minute{0};
};

struct SchedulerConfig final {
    bool enabled{true};                                   /**< Start background threads in `start()`. */
    WeeklySchedule weekly{};
    int cleanup_hour{3};                                  /**< Daily expired-entry sweep, UTC hour. */
    std::size_t batch_size{10};
    std::size_t max_concurrent_analyses{2};
    std::chrono::milliseconds run_budget{std::chrono::seconds{3600}};
    std::chrono::milliseconds compute_timeout{std::chrono::seconds{1800}}; /**< Per-city analysis bound. */
    std::chrono::milliseconds batch_pause{5000};
    int max_retries{3};                                   /**< Extra attempts for transient failures. */
    std::chrono::milliseconds retry_delay{std::chrono::seconds{300}};
    NdviParameters ndvi{};
};

enum class SchedulerState {
    Idle,
    Running
};

enum class BatchRunStatus {
    Completed,        /**< Every enumerated city was attempted. */
    AbortedOnTimeout, /**< The run budget stopped new work. */
    Interrupted,      /**< `stop()` stopped new work. */
    Rejected          /**< Another run was already active. */
};

[[nodiscard]] std::string_view to_string(SchedulerState state) noexcept;
[[nodiscard]] std::string_view to_string(BatchRunStatus status) noexcept;

/**
 * @brief Outcome of one city within a run.
 */
struct CityOutcome final {
    std::string city_name{};
    std::optional<std::int64_t> city_id{};
    bool success{false};
    std::optional<ErrorKind> error_kind{}; /**< Empty for successes and non-taxonomy failures. */
    std::string reason{};
    std::optional<CoverageResult> result{};
    int attempts{0};
    bool cached{false};                    /**< Fresh result reached the store. */
    std::size_t invalidated_entries{0};    /**< Stale entries removed after the write. */
};

struct BatchRunSummary final {
    std::string run_name{};
    BatchRunStatus status{BatchRunStatus::Completed};
    WallTime started_at{};
    WallTime finished_at{};
    std::vector<CityOutcome> outcomes{}; /**< Attempted cities in enumeration order. */
    std::size_t not_attempted{0};        /**< Cities skipped once the budget ran out. */

    [[nodiscard]] std::size_t succeeded() const noexcept;
    [[nodiscard]] std::size_t failed() const noexcept;
};

struct SchedulerStatus final {
    SchedulerState state{SchedulerState::Idle};
    bool background_active{false};
    std::optional<WallTime> next_run_time{};
    std::optional<WallTime> next_cleanup_time{};
    SchedulerConfig config{};
    std::optional<BatchRunSummary> last_run{};
};

/**
 * @brief Analysis of one city; receives the resolved parameters and a deadline.
 */
using CoverageJob = std::function<CoverageResult(const CityRecord& city,
                                                 const CityDataFiles& files,
                                                 const NdviParameters& parameters,
                                                 TimePoint deadline)>;

/** @brief First weekly occurrence strictly after `now`. */
[[nodiscard]] WallTime next_weekly_occurrence(WallTime now, const WeeklySchedule& schedule);

/** @brief First `hour`:00 UTC strictly after `now`. */
[[nodiscard]] WallTime next_daily_occurrence(WallTime now, int hour);

class RecomputeScheduler final {
  public:
    /**
     * @throws std::invalid_argument for out-of-range schedule or batch settings.
     */
    RecomputeScheduler(SchedulerConfig config,
                       CityRegistryPtr registry,
                       ImageryCatalogPtr catalog,
                       std::shared_ptr<CacheOrchestrator> orchestrator,
                       CoverageJob job,
                       WallClockSource clock = system_wall_clock());
    ~RecomputeScheduler();

    RecomputeScheduler(const RecomputeScheduler&) = delete;
    RecomputeScheduler& operator=(const RecomputeScheduler&) = delete;

    /**
     * @brief Run now for every city, or only for `city_name`.
     *
     * Returns a `Rejected` summary immediately when a run is in progress.
     */
    BatchRunSummary trigger_batch_run(const std::optional<std::string>& city_name = std::nullopt);

    /** @brief Launch the weekly and daily background threads. */
    void start();
    /**
     * @brief Wake and join the background threads.
     *
     * An active run takes no new cities once stopping begins; `stop()` returns
     * after it has finished.
     */
    void stop();

    [[nodiscard]] SchedulerStatus status() const;
    [[nodiscard]] const SchedulerConfig& config() const noexcept;

  private:
    struct WorkItem final {
        CityRecord city{};
        std::optional<CityDataFiles> files{};
    };

    BatchRunSummary start_run(const std::string& run_name, const std::optional<std::string>& city_name);
    BatchRunSummary execute_run(const std::string& run_name, const std::optional<std::string>& city_name);
    std::vector<WorkItem> enumerate_work(const std::optional<std::string>& city_name,
                                         std::vector<CityOutcome>& early_failures) const;
    CityOutcome process_city(const WorkItem& item);
    void weekly_loop();
    void cleanup_loop();
    /** @brief Sleep until `target` on the injected clock; false when stopping. */
    bool wait_until(WallTime target);
    /** @brief Interruptible sleep; false when stopping. */
    bool pause_for(std::chrono::milliseconds duration);

    SchedulerConfig config_;
    CityRegistryPtr registry_;
    ImageryCatalogPtr catalog_;
    std::shared_ptr<CacheOrchestrator> orchestrator_;
    CoverageJob job_;
    WallClockSource clock_;
    std::shared_ptr<spdlog::logger> logger_;

    std::atomic<SchedulerState> state_{SchedulerState::Idle};
    std::atomic<bool> flag_background_{false};
    std::atomic<bool> flag_stopping_{false};
    mutable std::mutex mutex_;
    std::condition_variable stop_cv_;
    std::condition_variable idle_cv_;
    std::optional<WallTime> next_run_time_;
    std::optional<WallTime> next_cleanup_time_;
    std::optional<BatchRunSummary> last_run_;
    std::thread weekly_thread_;
    std::thread cleanup_thread_;
};

}  // namespace green_coverage
