// === Calculation Type ========================================================
//
// Tag carried by every cache entry. The closed set (`satellite`, `stats`,
// `stored`) is extended by named custom tags for caller-defined computations.

#pragma once

#include <string>
#include <string_view>

namespace green_coverage {

/**
 * @brief Category of a cached computation.
 */
class CalculationType final {
  public:
    enum class Kind {
        Satellite, /**< NDVI analysis of satellite imagery. */
        Stats,     /**< Comparison statistics derived from stored coverage. */
        Stored,    /**< Stored per-year coverage record. */
        Custom     /**< Caller-defined computation identified by a tag. */
    };

    static CalculationType satellite() noexcept;
    static CalculationType stats() noexcept;
    static CalculationType stored() noexcept;
    /** @brief Throws `std::invalid_argument` for an empty or reserved tag. */
    static CalculationType custom(std::string tag);
    /** @brief Parse a persisted name; unknown names become custom tags. */
    static CalculationType parse(std::string_view name);

    [[nodiscard]] Kind kind() const noexcept;
    /** @brief Persisted name: `satellite`, `stats`, `stored`, or the custom tag. */
    [[nodiscard]] std::string name() const;

    bool operator==(const CalculationType& other) const = default;

  private:
    CalculationType(Kind kind, std::string tag);

    Kind kind_;
    std::string str_tag_;
};

}  // namespace green_coverage
