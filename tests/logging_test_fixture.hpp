#pragma once

#include "green_coverage/logging.hpp"

#include <filesystem>
#include <memory>

namespace green_coverage::test {

inline void ensure_logger_initialized() {
    static const std::shared_ptr<spdlog::logger> logger_handle = []() {
        const auto log_dir = std::filesystem::temp_directory_path() / "green_coverage_tests_logs";
        auto logger = green_coverage::initialize_logger(log_dir.string());
        logger->set_level(spdlog::level::warn);
        return logger;
    }();
    (void)logger_handle;
}

}  // namespace green_coverage::test
