// === Expiration Policy =======================================================
//
// Time-to-live per calculation type. Satellite analyses are expensive and
// change slowly; comparison statistics are cheap and refresh more often.

#pragma once

#include <chrono>
#include <map>
#include <string>

#include "green_coverage/calculation_type.hpp"

namespace green_coverage {

struct ExpirationPolicy final {
    std::chrono::seconds satellite_ttl{std::chrono::hours{72}};
    std::chrono::seconds stats_ttl{std::chrono::hours{12}};
    std::chrono::seconds default_ttl{std::chrono::hours{24}}; /**< Stored records and unlisted custom tags. */
    std::map<std::string, std::chrono::seconds> custom_ttls{};

    [[nodiscard]] std::chrono::seconds ttl_for(const CalculationType& type) const;
};

}  // namespace green_coverage
