#include "green_coverage/errors.hpp"

#include <utility>

namespace green_coverage {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::CityNotFound:
            return "city_not_found";
        case ErrorKind::AmbiguousCity:
            return "ambiguous_city";
        case ErrorKind::SpatialMismatch:
            return "spatial_mismatch";
        case ErrorKind::NoValidPixels:
            return "no_valid_pixels";
        case ErrorKind::UnsupportedFormat:
            return "unsupported_format";
        case ErrorKind::MissingInput:
            return "missing_input";
        case ErrorKind::ComputeTimeout:
            return "compute_timeout";
        case ErrorKind::CacheUnavailable:
            return "cache_unavailable";
    }
    return "unknown";
}

CoverageError::CoverageError(ErrorKind kind, const std::string& message, std::string hint)
    : std::runtime_error(message),
      kind_(kind),
      str_hint_(std::move(hint)) {}

ErrorKind CoverageError::kind() const noexcept {
    return kind_;
}

const std::string& CoverageError::hint() const noexcept {
    return str_hint_;
}

}  // namespace green_coverage
