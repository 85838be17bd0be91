#include "green_coverage/calculation_type.hpp"

#include <stdexcept>
#include <utility>

namespace green_coverage {

namespace {
constexpr std::string_view k_satellite_name{"satellite"};
constexpr std::string_view k_stats_name{"stats"};
constexpr std::string_view k_stored_name{"stored"};

bool is_reserved(std::string_view name) noexcept {
    return name == k_satellite_name || name == k_stats_name || name == k_stored_name;
}
}  // namespace

CalculationType::CalculationType(Kind kind, std::string tag)
    : kind_(kind),
      str_tag_(std::move(tag)) {}

CalculationType CalculationType::satellite() noexcept {
    return CalculationType{Kind::Satellite, {}};
}

CalculationType CalculationType::stats() noexcept {
    return CalculationType{Kind::Stats, {}};
}

CalculationType CalculationType::stored() noexcept {
    return CalculationType{Kind::Stored, {}};
}

CalculationType CalculationType::custom(std::string tag) {
    if (tag.empty()) {
        throw std::invalid_argument("Custom calculation type requires a non-empty tag");
    }
    if (is_reserved(tag)) {
        throw std::invalid_argument("Custom calculation tag '" + tag + "' collides with a built-in type");
    }
    return CalculationType{Kind::Custom, std::move(tag)};
}

CalculationType CalculationType::parse(std::string_view name) {
    if (name == k_satellite_name) {
        return satellite();
    }
    if (name == k_stats_name) {
        return stats();
    }
    if (name == k_stored_name) {
        return stored();
    }
    return custom(std::string{name});
}

CalculationType::Kind CalculationType::kind() const noexcept {
    return kind_;
}

std::string CalculationType::name() const {
    switch (kind_) {
        case Kind::Satellite:
            return std::string{k_satellite_name};
        case Kind::Stats:
            return std::string{k_stats_name};
        case Kind::Stored:
            return std::string{k_stored_name};
        case Kind::Custom:
            break;
    }
    return str_tag_;
}

}  // namespace green_coverage
