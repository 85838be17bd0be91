#include "green_coverage/expiration_policy.hpp"

namespace green_coverage {

std::chrono::seconds ExpirationPolicy::ttl_for(const CalculationType& type) const {
    switch (type.kind()) {
        case CalculationType::Kind::Satellite:
            return satellite_ttl;
        case CalculationType::Kind::Stats:
            return stats_ttl;
        case CalculationType::Kind::Stored:
            return default_ttl;
        case CalculationType::Kind::Custom:
            break;
    }
    if (const auto found = custom_ttls.find(type.name()); found != custom_ttls.end()) {
        return found->second;
    }
    return default_ttl;
}

}  // namespace green_coverage
