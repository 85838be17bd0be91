// === Logging =================================================================
//
// Shared spdlog logger for the engine: colour console output plus a rotating
// JSON-lines file under the configured log directory.

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

namespace green_coverage {

/** @brief Create the shared logger once; later calls return the same instance. */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @brief Shared logger; throws `std::runtime_error` before initialization. */
std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

/**
 * @brief Log one structured event on the shared logger.
 *
 * The message body is a JSON object led by `component` and `event`, followed
 * by `fields` in insertion order. String values are escaped, so exception
 * text cannot break the JSON-lines file.
 */
void log_event(spdlog::level::level_enum level,
               std::string_view component,
               std::string_view event,
               const nlohmann::ordered_json& fields = nlohmann::ordered_json::object());

}  // namespace green_coverage
