#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "green_coverage/configuration.hpp"
#include "green_coverage/coverage_service.hpp"
#include "green_coverage/errors.hpp"
#include "green_coverage/logging.hpp"
#include "green_coverage/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}

void print_usage() {
    std::cerr << "usage: green_coverage_service [serve | run-now [city] | sweep | stats | cities"
                 " | invalidate <city> [type] | compare <city> | compute <boundary> <raster> <city>]\n";
}

int serve(green_coverage::CoverageService& service) {
    service.start();
    while (!should_terminate.load()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    service.shutdown();
    return EXIT_SUCCESS;
}

int run_now(green_coverage::CoverageService& service, const std::optional<std::string>& city_name) {
    using namespace green_coverage;
    const BatchRunSummary summary = service.trigger_batch_run(city_name);
    std::cout << summary.run_name << ": " << to_string(summary.status) << ", " << summary.succeeded() << " succeeded, "
              << summary.failed() << " failed, " << summary.not_attempted << " not attempted\n";
    for (const CityOutcome& outcome : summary.outcomes) {
        if (outcome.success) {
            std::cout << "  " << outcome.city_name << ": " << outcome.result->coverage_percentage << "%\n";
        } else {
            std::cout << "  " << outcome.city_name << ": FAILED ("
                      << (outcome.error_kind.has_value() ? to_string(outcome.error_kind.value()) : "error") << ") "
                      << outcome.reason << '\n';
        }
    }
    return summary.status == BatchRunStatus::Completed ? EXIT_SUCCESS : EXIT_FAILURE;
}

int print_stats(green_coverage::CoverageService& service) {
    const green_coverage::CacheStats stats = service.cache_stats();
    std::cout << "total=" << stats.total_entries << " valid=" << stats.valid_entries << " expired=" << stats.expired_entries << '\n';
    for (const auto& [type_name, count] : stats.by_type) {
        std::cout << "  " << type_name << '=' << count << '\n';
    }
    return EXIT_SUCCESS;
}
}  // namespace

int main(int argc, char** argv) {
    using namespace green_coverage;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    const std::vector<std::string> arguments(argv + 1, argv + argc);
    const std::string command = arguments.empty() ? "serve" : arguments.front();

    try {
        Configuration configuration = ConfigurationLoader::load(".");

        if (const char* desired_level = std::getenv("GREEN_COVERAGE_LOG_LEVEL"); desired_level != nullptr) {
            set_log_level(desired_level);
        }
        get_logger()->info("green_coverage_service {} command={}", k_version, command);

        CoverageService service{std::move(configuration)};

        if (command == "serve") {
            return serve(service);
        }
        if (command == "run-now") {
            return run_now(service, arguments.size() > 1 ? std::optional<std::string>{arguments[1]} : std::nullopt);
        }
        if (command == "sweep") {
            std::cout << "removed " << service.sweep_expired() << " expired entries\n";
            return EXIT_SUCCESS;
        }
        if (command == "stats") {
            return print_stats(service);
        }
        if (command == "cities") {
            for (const std::string& city : service.cached_cities()) {
                std::cout << city << '\n';
            }
            return EXIT_SUCCESS;
        }
        if (command == "invalidate" && arguments.size() >= 2) {
            const std::optional<CalculationType> type =
                arguments.size() > 2 ? std::optional<CalculationType>{CalculationType::parse(arguments[2])} : std::nullopt;
            std::cout << "removed " << service.invalidate(arguments[1], type) << " entries\n";
            return EXIT_SUCCESS;
        }
        if (command == "compare" && arguments.size() >= 2) {
            const CoverageComparison comparison = service.compare_coverage(arguments[1]);
            std::cout << comparison.comparison_result << '\n';
            return EXIT_SUCCESS;
        }
        if (command == "compute" && arguments.size() >= 4) {
            CoverageRequest request{};
            request.boundary_path = arguments[1];
            request.raster_path = arguments[2];
            request.city_name = arguments[3];
            const CoverageResult result = service.compute_coverage(request);
            std::cout << result.city_name << ": " << result.coverage_percentage << "% green (" << result.vegetated_area_km2
                      << " of " << result.total_area_km2 << " km2, mean NDVI " << result.ndvi_mean << ")\n";
            return EXIT_SUCCESS;
        }
        print_usage();
        return EXIT_FAILURE;
    } catch (const CoverageError& exc) {
        get_logger()->error("{} failed ({}): {}", command, to_string(exc.kind()), exc.what());
        if (!exc.hint().empty()) {
            std::cerr << "hint: " << exc.hint() << '\n';
        }
        return EXIT_FAILURE;
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }
}
