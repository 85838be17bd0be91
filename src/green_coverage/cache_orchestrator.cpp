#include "green_coverage/cache_orchestrator.hpp"

#include <utility>

#include "green_coverage/errors.hpp"
#include "green_coverage/logging.hpp"

namespace green_coverage {

CacheOrchestrator::CacheOrchestrator(CacheStorePtr store, ExpirationPolicy policy, WallClockSource clock)
    : store_(std::move(store)),
      policy_(std::move(policy)),
      clock_(std::move(clock)),
      logger_(get_logger()) {
    if (store_ == nullptr) {
        throw std::invalid_argument("CacheOrchestrator requires a cache store");
    }
    if (!clock_) {
        clock_ = system_wall_clock();
    }
}

std::string CacheOrchestrator::key_for(const CacheRequest& request) const {
    return derive_cache_key(request.type, request.key_params);
}

const ExpirationPolicy& CacheOrchestrator::policy() const noexcept {
    return policy_;
}

CachePayload CacheOrchestrator::get_or_compute(const CacheRequest& request, const ComputeFn& compute) {
    const std::string key = key_for(request);

    try {
        if (std::optional<CachePayload> cached = lookup(key, request)) {
            log_event(spdlog::level::debug, "cache", "hit", {{"type", request.type.name()}, {"city", request.city_name}});
            return std::move(cached.value());
        }
    } catch (const CoverageError& exc) {
        if (exc.kind() != ErrorKind::CacheUnavailable) {
            throw;
        }
        log_event(spdlog::level::warn, "cache", "degraded", {{"operation", "get"}, {"error", exc.what()}});
        return compute_checked(request, compute);
    }

    log_event(spdlog::level::info, "cache", "miss", {{"type", request.type.name()}, {"city", request.city_name}});
    CachePayload payload = compute_checked(request, compute);
    if (!write_back(key, request, payload)) {
        logger_->debug("Returning uncached result for {}", request.city_name);
    }
    return payload;
}

RefreshOutcome CacheOrchestrator::refresh(const CacheRequest& request, const ComputeFn& compute) {
    RefreshOutcome outcome{};
    outcome.cache_key = key_for(request);
    outcome.payload = compute_checked(request, compute);
    outcome.cached = write_back(outcome.cache_key, request, outcome.payload);
    return outcome;
}

std::size_t CacheOrchestrator::invalidate(const std::string& city_name, const std::optional<CalculationType>& type) {
    InvalidationFilter filter{};
    filter.city_name = city_name;
    if (type.has_value()) {
        filter.types.push_back(type.value());
    }
    const std::size_t removed = store_->delete_by_city(filter);
    log_event(spdlog::level::info, "cache", "invalidate", {
        {"city", city_name},
        {"type", type.has_value() ? type->name() : std::string{"all"}},
        {"removed", removed}
    });
    return removed;
}

std::size_t CacheOrchestrator::invalidate_stale(const std::string& city_name,
                                                const std::vector<CalculationType>& types,
                                                const std::string& keep_key) {
    InvalidationFilter filter{};
    filter.city_name = city_name;
    filter.types = types;
    filter.preserve_key = keep_key;
    return store_->delete_by_city(filter);
}

std::size_t CacheOrchestrator::invalidate_types(const std::vector<CalculationType>& types) {
    const std::size_t removed = store_->delete_by_types(types);
    log_event(spdlog::level::info, "cache", "invalidate_types", {{"removed", removed}});
    return removed;
}

std::size_t CacheOrchestrator::sweep_expired() {
    const std::size_t removed = store_->delete_expired(clock_());
    log_event(spdlog::level::info, "cache", "sweep", {{"removed", removed}});
    return removed;
}

CacheStats CacheOrchestrator::cache_stats() {
    return store_->stats(clock_());
}

std::vector<std::string> CacheOrchestrator::cached_cities() {
    return store_->cached_cities();
}

std::optional<CachePayload> CacheOrchestrator::lookup(const std::string& key, const CacheRequest& request) {
    const std::optional<CacheEntry> entry = store_->get(key, clock_());
    if (!entry.has_value()) {
        return std::nullopt;
    }
    try {
        CachePayload payload = decode_payload(request.type, entry->payload);
        if (entry->calculation_type == request.type && payload_matches(request.type, payload)) {
            return payload;
        }
        log_event(spdlog::level::warn, "cache", "type_mismatch", {{"key", key}, {"stored_type", entry->calculation_type.name()}});
    } catch (const std::invalid_argument& exc) {
        log_event(spdlog::level::warn, "cache", "corrupt", {{"key", key}, {"error", exc.what()}});
    }
    store_->erase(key);
    return std::nullopt;
}

CachePayload CacheOrchestrator::compute_checked(const CacheRequest& request, const ComputeFn& compute) const {
    CachePayload payload = compute();
    if (!payload_matches(request.type, payload)) {
        throw std::invalid_argument("Computed payload does not match calculation type " + request.type.name());
    }
    return payload;
}

bool CacheOrchestrator::write_back(const std::string& key, const CacheRequest& request, const CachePayload& payload) {
    const WallTime now = clock_();
    CacheEntry entry{};
    entry.cache_key = key;
    entry.calculation_type = request.type;
    entry.city_id = request.city_id;
    entry.city_name = request.city_name;
    entry.payload = encode_payload(payload);
    entry.created_at = now;
    entry.expires_at = now + request.ttl_override.value_or(policy_.ttl_for(request.type));

    try {
        store_->put(entry);
    } catch (const CoverageError& exc) {
        if (exc.kind() != ErrorKind::CacheUnavailable) {
            throw;
        }
        log_event(spdlog::level::warn, "cache", "degraded", {{"operation", "put"}, {"error", exc.what()}});
        return false;
    }

    if (!request.city_name.empty()) {
        try {
            const std::size_t swept = store_->delete_expired(now, request.city_name);
            if (swept > 0) {
                logger_->debug("Swept {} expired entries for {}", swept, request.city_name);
            }
        } catch (const CoverageError& exc) {
            logger_->warn("Opportunistic sweep for {} failed: {}", request.city_name, exc.what());
        }
    }
    return true;
}

}  // namespace green_coverage
