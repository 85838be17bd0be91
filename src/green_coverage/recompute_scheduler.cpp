// === Recompute Scheduler =====================================================
//
// Batch recomputation of city coverage.
//
// Responsibilities
// - Guard against overlapping runs with an atomic Idle -> Running transition.
// - Enumerate cities that have imagery, partition them into batches, and run
//   each batch on a bounded worker pool whose outcomes land in per-index slots
//   so attribution never depends on completion order.
// - Refresh each city's satellite entry through the orchestrator and only then
//   delete the city's stale satellite/stats entries.
// - Stop starting new cities once the run budget is spent; in-flight cities
//   finish and the run reports `aborted_on_timeout`.
// - Host the weekly recomputation and daily sweep threads.

#include "green_coverage/recompute_scheduler.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "green_coverage/coverage_requests.hpp"
#include "green_coverage/logging.hpp"

namespace green_coverage {

namespace {

constexpr char k_weekly_run_name[] = "weekly_update";
constexpr std::chrono::minutes k_max_wait_slice{1};

/**
 * @brief Returns the scheduler to Idle when a run leaves scope.
 */
class RunStateGuard final {
  public:
    RunStateGuard(std::atomic<SchedulerState>& state, std::mutex& mutex, std::condition_variable& idle_cv)
        : state_(state),
          mutex_(mutex),
          idle_cv_(idle_cv) {}
    ~RunStateGuard() {
        {
            std::scoped_lock lock(mutex_);
            state_.store(SchedulerState::Idle);
        }
        idle_cv_.notify_all();
    }

    RunStateGuard(const RunStateGuard&) = delete;
    RunStateGuard& operator=(const RunStateGuard&) = delete;

  private:
    std::atomic<SchedulerState>& state_;
    std::mutex& mutex_;
    std::condition_variable& idle_cv_;
};

void validate_config(const SchedulerConfig& config) {
    if (config.weekly.day_of_week < 0 || config.weekly.day_of_week > 6) {
        throw std::invalid_argument("Weekly day_of_week must be in 0..6 (Monday..Sunday)");
    }
    if (config.weekly.hour < 0 || config.weekly.hour > 23 || config.cleanup_hour < 0 || config.cleanup_hour > 23) {
        throw std::invalid_argument("Schedule hours must be in 0..23");
    }
    if (config.weekly.minute < 0 || config.weekly.minute > 59) {
        throw std::invalid_argument("Weekly minute must be in 0..59");
    }
    if (config.batch_size == 0 || config.max_concurrent_analyses == 0) {
        throw std::invalid_argument("batch_size and max_concurrent_analyses must be positive");
    }
    if (config.max_retries < 0) {
        throw std::invalid_argument("max_retries must not be negative");
    }
}

}  // namespace

std::string_view to_string(SchedulerState state) noexcept {
    return state == SchedulerState::Running ? "running" : "idle";
}

std::string_view to_string(BatchRunStatus status) noexcept {
    switch (status) {
        case BatchRunStatus::Completed:
            return "completed";
        case BatchRunStatus::AbortedOnTimeout:
            return "aborted_on_timeout";
        case BatchRunStatus::Interrupted:
            return "interrupted";
        case BatchRunStatus::Rejected:
            break;
    }
    return "rejected";
}

std::size_t BatchRunSummary::succeeded() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(outcomes.begin(), outcomes.end(), [](const CityOutcome& outcome) { return outcome.success; })
    );
}

std::size_t BatchRunSummary::failed() const noexcept {
    return outcomes.size() - succeeded();
}

WallTime next_weekly_occurrence(WallTime now, const WeeklySchedule& schedule) {
    const std::chrono::sys_days today = std::chrono::floor<std::chrono::days>(now);
    const auto offset = std::chrono::hours{schedule.hour} + std::chrono::minutes{schedule.minute};
    for (int day = 0; day <= 7; ++day) {
        const std::chrono::sys_days candidate_day = today + std::chrono::days{day};
        const int monday_based = static_cast<int>(std::chrono::weekday{candidate_day}.iso_encoding()) - 1;
        const WallTime candidate = candidate_day + offset;
        if (monday_based == schedule.day_of_week && candidate > now) {
            return candidate;
        }
    }
    throw std::invalid_argument("Weekly schedule day_of_week must be in 0..6");
}

WallTime next_daily_occurrence(WallTime now, int hour) {
    const std::chrono::sys_days today = std::chrono::floor<std::chrono::days>(now);
    const WallTime candidate = today + std::chrono::hours{hour};
    if (candidate > now) {
        return candidate;
    }
    return candidate + std::chrono::days{1};
}

RecomputeScheduler::RecomputeScheduler(SchedulerConfig config,
                                       CityRegistryPtr registry,
                                       ImageryCatalogPtr catalog,
                                       std::shared_ptr<CacheOrchestrator> orchestrator,
                                       CoverageJob job,
                                       WallClockSource clock)
    : config_(std::move(config)),
      registry_(std::move(registry)),
      catalog_(std::move(catalog)),
      orchestrator_(std::move(orchestrator)),
      job_(std::move(job)),
      clock_(clock ? std::move(clock) : system_wall_clock()),
      logger_(get_logger()) {
    validate_config(config_);
    if (registry_ == nullptr || catalog_ == nullptr || orchestrator_ == nullptr || !job_) {
        throw std::invalid_argument("RecomputeScheduler requires a registry, catalog, orchestrator and job");
    }
}

RecomputeScheduler::~RecomputeScheduler() {
    stop();
}

const SchedulerConfig& RecomputeScheduler::config() const noexcept {
    return config_;
}

BatchRunSummary RecomputeScheduler::trigger_batch_run(const std::optional<std::string>& city_name) {
    const std::string run_name = city_name.has_value() ? "manual_update_" + city_name.value() : "manual_update_all_cities";
    return start_run(run_name, city_name);
}

BatchRunSummary RecomputeScheduler::start_run(const std::string& run_name, const std::optional<std::string>& city_name) {
    SchedulerState expected = SchedulerState::Idle;
    if (!state_.compare_exchange_strong(expected, SchedulerState::Running)) {
        log_event(spdlog::level::warn, "scheduler", "rejected", {{"run", run_name}, {"reason", "run in progress"}});
        BatchRunSummary rejected{};
        rejected.run_name = run_name;
        rejected.status = BatchRunStatus::Rejected;
        rejected.started_at = clock_();
        rejected.finished_at = rejected.started_at;
        return rejected;
    }
    const RunStateGuard guard{state_, mutex_, idle_cv_};
    BatchRunSummary summary = execute_run(run_name, city_name);
    {
        std::scoped_lock lock(mutex_);
        last_run_ = summary;
    }
    return summary;
}

std::vector<RecomputeScheduler::WorkItem> RecomputeScheduler::enumerate_work(const std::optional<std::string>& city_name,
                                                                             std::vector<CityOutcome>& early_failures) const {
    std::vector<WorkItem> items;
    if (city_name.has_value()) {
        const std::optional<CityRecord> city = registry_->find_city(city_name.value());
        if (!city.has_value()) {
            CityOutcome outcome{};
            outcome.city_name = city_name.value();
            outcome.error_kind = ErrorKind::CityNotFound;
            outcome.reason = "City '" + city_name.value() + "' not found";
            early_failures.push_back(std::move(outcome));
            return items;
        }
        items.push_back(WorkItem{city.value(), catalog_->locate(city.value())});
        return items;
    }

    for (const CityRecord& city : registry_->list_cities()) {
        std::optional<CityDataFiles> files = catalog_->locate(city);
        if (!files.has_value()) {
            logger_->info("Skipping {}: no satellite imagery available", city.name);
            continue;
        }
        items.push_back(WorkItem{city, std::move(files)});
    }
    return items;
}

BatchRunSummary RecomputeScheduler::execute_run(const std::string& run_name, const std::optional<std::string>& city_name) {
    BatchRunSummary summary{};
    summary.run_name = run_name;
    summary.started_at = clock_();

    const std::vector<WorkItem> items = enumerate_work(city_name, summary.outcomes);
    log_event(spdlog::level::info, "scheduler", "start", {
        {"run", run_name},
        {"cities", items.size()},
        {"batch_size", config_.batch_size}
    });

    std::vector<std::optional<CityOutcome>> slots(items.size());
    const TimePoint run_start = SteadyClock::now();
    const auto budget_exhausted = [this, run_start]() { return SteadyClock::now() - run_start >= config_.run_budget; };

    bool budget_hit = false;
    bool interrupted = false;
    for (std::size_t batch_start = 0; batch_start < items.size() && !budget_hit && !interrupted;
         batch_start += config_.batch_size) {
        const std::size_t batch_end = std::min(items.size(), batch_start + config_.batch_size);
        if (batch_start > 0 && config_.batch_pause.count() > 0 && !pause_for(config_.batch_pause)) {
            interrupted = true;
            break;
        }

        std::atomic<std::size_t> next_index{batch_start};
        std::atomic<bool> flag_budget_hit{false};
        std::atomic<bool> flag_interrupted{false};
        const auto worker = [&]() {
            while (true) {
                if (flag_stopping_.load()) {
                    flag_interrupted.store(true);
                    return;
                }
                if (budget_exhausted()) {
                    flag_budget_hit.store(true);
                    return;
                }
                const std::size_t index = next_index.fetch_add(1);
                if (index >= batch_end) {
                    return;
                }
                slots[index] = process_city(items[index]);
            }
        };

        const std::size_t worker_count = std::min(config_.max_concurrent_analyses, batch_end - batch_start);
        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (std::size_t index = 0; index < worker_count; ++index) {
            workers.emplace_back(worker);
        }
        for (std::thread& thread : workers) {
            thread.join();
        }
        budget_hit = flag_budget_hit.load();
        interrupted = flag_interrupted.load();
        logger_->info("Run {} finished batch {}-{}", run_name, batch_start + 1, batch_end);
    }

    for (std::optional<CityOutcome>& slot : slots) {
        if (slot.has_value()) {
            summary.outcomes.push_back(std::move(slot.value()));
        } else {
            ++summary.not_attempted;
        }
    }
    if (summary.not_attempted == 0) {
        summary.status = BatchRunStatus::Completed;
    } else {
        summary.status = interrupted ? BatchRunStatus::Interrupted : BatchRunStatus::AbortedOnTimeout;
    }
    summary.finished_at = clock_();

    const auto elapsed_s = std::chrono::duration_cast<Duration>(SteadyClock::now() - run_start).count();
    log_event(spdlog::level::info, "scheduler", "finish", {
        {"run", run_name},
        {"status", std::string{to_string(summary.status)}},
        {"succeeded", summary.succeeded()},
        {"failed", summary.failed()},
        {"not_attempted", summary.not_attempted},
        {"elapsed_s", elapsed_s}
    });
    return summary;
}

CityOutcome RecomputeScheduler::process_city(const WorkItem& item) {
    CityOutcome outcome{};
    outcome.city_name = item.city.name;
    outcome.city_id = item.city.id;

    if (!item.files.has_value()) {
        outcome.error_kind = ErrorKind::MissingInput;
        outcome.reason = "No satellite data files found for " + item.city.name;
        log_event(spdlog::level::warn, "scheduler", "city_failed", {{"city", item.city.name}, {"error", "missing_input"}});
        return outcome;
    }

    NdviParameters parameters = config_.ndvi;
    if (!parameters.year.has_value()) {
        parameters.year = utc_year(clock_());
    }

    std::optional<RefreshOutcome> refreshed;
    const int max_attempts = config_.max_retries + 1;
    for (int attempt = 1; attempt <= max_attempts && !refreshed.has_value(); ++attempt) {
        outcome.attempts = attempt;
        try {
            const CacheRequest request = satellite_request(
                item.city.name, item.city.id, item.files->raster_path, item.files->boundary_path, parameters
            );
            const TimePoint deadline = SteadyClock::now() + config_.compute_timeout;
            refreshed = orchestrator_->refresh(request, [&]() {
                return CachePayload{job_(item.city, item.files.value(), parameters, deadline)};
            });
        } catch (const CoverageError& exc) {
            outcome.error_kind = exc.kind();
            outcome.reason = exc.what();
            log_event(spdlog::level::warn, "scheduler", "city_failed", {
                {"city", item.city.name},
                {"error", std::string{to_string(exc.kind())}},
                {"reason", exc.what()}
            });
            return outcome;
        } catch (const std::exception& exc) {
            outcome.reason = exc.what();
            log_event(spdlog::level::err, "scheduler", "attempt_failed", {
                {"city", item.city.name},
                {"attempt", attempt},
                {"error", exc.what()}
            });
            if (attempt < max_attempts && !pause_for(config_.retry_delay)) {
                logger_->warn("Retries for {} abandoned: scheduler stopping", item.city.name);
                break;
            }
        }
    }
    if (!refreshed.has_value()) {
        return outcome;
    }

    outcome.success = true;
    outcome.reason.clear();
    outcome.result = std::get<CoverageResult>(refreshed->payload);
    outcome.cached = refreshed->cached;
    if (refreshed->cached) {
        try {
            outcome.invalidated_entries = orchestrator_->invalidate_stale(
                item.city.name, {CalculationType::satellite(), CalculationType::stats()}, refreshed->cache_key
            );
        } catch (const CoverageError& exc) {
            logger_->warn("Stale entry cleanup for {} failed: {}", item.city.name, exc.what());
        }
    }
    log_event(spdlog::level::info, "scheduler", "city_refreshed", {
        {"city", item.city.name},
        {"coverage_pct", outcome.result->coverage_percentage},
        {"attempts", outcome.attempts},
        {"invalidated", outcome.invalidated_entries}
    });
    return outcome;
}

void RecomputeScheduler::start() {
    if (!config_.enabled) {
        logger_->info("Background recomputation disabled by configuration");
        return;
    }
    if (flag_background_.exchange(true)) {
        return;
    }
    {
        std::scoped_lock lock(mutex_);
        flag_stopping_.store(false);
    }
    logger_->info("Starting background scheduler");
    weekly_thread_ = std::thread(&RecomputeScheduler::weekly_loop, this);
    cleanup_thread_ = std::thread(&RecomputeScheduler::cleanup_loop, this);
}

void RecomputeScheduler::stop() {
    if (!flag_background_.exchange(false)) {
        return;
    }
    logger_->info("Stopping background scheduler");
    {
        std::scoped_lock lock(mutex_);
        flag_stopping_.store(true);
    }
    stop_cv_.notify_all();
    if (weekly_thread_.joinable()) {
        weekly_thread_.join();
    }
    if (cleanup_thread_.joinable()) {
        cleanup_thread_.join();
    }

    // A manual run may still be winding down; later runs must pause normally.
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this]() { return state_.load() != SchedulerState::Running; });
    flag_stopping_.store(false);
}

SchedulerStatus RecomputeScheduler::status() const {
    SchedulerStatus status{};
    status.state = state_.load();
    status.background_active = flag_background_.load();
    status.config = config_;
    const WallTime now = clock_();
    std::scoped_lock lock(mutex_);
    status.next_run_time = next_run_time_.has_value() ? next_run_time_ : std::optional<WallTime>{next_weekly_occurrence(now, config_.weekly)};
    status.next_cleanup_time = next_cleanup_time_.has_value() ? next_cleanup_time_ : std::optional<WallTime>{next_daily_occurrence(now, config_.cleanup_hour)};
    status.last_run = last_run_;
    return status;
}

void RecomputeScheduler::weekly_loop() {
    while (!flag_stopping_.load()) {
        const WallTime next_run = next_weekly_occurrence(clock_(), config_.weekly);
        {
            std::scoped_lock lock(mutex_);
            next_run_time_ = next_run;
        }
        if (!wait_until(next_run)) {
            break;
        }
        try {
            start_run(k_weekly_run_name, std::nullopt);
        } catch (const std::exception& exc) {
            logger_->error("Weekly recomputation failed: {}", exc.what());
        }
    }
    std::scoped_lock lock(mutex_);
    next_run_time_.reset();
}

void RecomputeScheduler::cleanup_loop() {
    while (!flag_stopping_.load()) {
        const WallTime next_cleanup = next_daily_occurrence(clock_(), config_.cleanup_hour);
        {
            std::scoped_lock lock(mutex_);
            next_cleanup_time_ = next_cleanup;
        }
        if (!wait_until(next_cleanup)) {
            break;
        }
        try {
            orchestrator_->sweep_expired();
        } catch (const std::exception& exc) {
            logger_->error("Cache cleanup failed: {}", exc.what());
        }
    }
    std::scoped_lock lock(mutex_);
    next_cleanup_time_.reset();
}

bool RecomputeScheduler::wait_until(WallTime target) {
    std::unique_lock lock(mutex_);
    while (!flag_stopping_.load()) {
        const WallTime now = clock_();
        if (now >= target) {
            return true;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(target - now);
        stop_cv_.wait_for(lock, std::min<std::chrono::milliseconds>(remaining + std::chrono::milliseconds{1}, k_max_wait_slice));
    }
    return false;
}

bool RecomputeScheduler::pause_for(std::chrono::milliseconds duration) {
    std::unique_lock lock(mutex_);
    return !stop_cv_.wait_for(lock, duration, [this]() { return flag_stopping_.load(); });
}

}  // namespace green_coverage
