// === Error Taxonomy ==========================================================
//
// Domain failures raised by the analyzer, the cache layer and the scheduler.
// Argument validation keeps using `std::invalid_argument`; everything a caller
// may want to branch on (or the batch scheduler records per city) is a
// `CoverageError` carrying an `ErrorKind`.

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace green_coverage {

/**
 * @brief Closed set of domain failure categories.
 */
enum class ErrorKind {
    CityNotFound,      /**< No boundary feature matches the requested city. */
    AmbiguousCity,     /**< More than one feature matches the requested city. */
    SpatialMismatch,   /**< Boundary and raster cannot be brought into one CRS. */
    NoValidPixels,     /**< Clip produced zero valid NDVI samples. */
    UnsupportedFormat, /**< Input file type or layout is not understood. */
    MissingInput,      /**< Input file is absent or unreadable. */
    ComputeTimeout,    /**< Analysis exceeded its deadline. */
    CacheUnavailable   /**< Persistence substrate failed. */
};

/** @brief Stable snake_case name used in logs and summaries. */
[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/**
 * @brief Exception type for all domain failures.
 */
class CoverageError final : public std::runtime_error {
  public:
    CoverageError(ErrorKind kind, const std::string& message, std::string hint = {});

    [[nodiscard]] ErrorKind kind() const noexcept;
    /** @brief Corrective action for the operator, possibly empty. */
    [[nodiscard]] const std::string& hint() const noexcept;

  private:
    ErrorKind kind_;
    std::string str_hint_;
};

}  // namespace green_coverage
