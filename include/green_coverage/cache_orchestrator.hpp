// === Cache Orchestrator ======================================================
//
// Cache-or-compute wrapper around any computation. Owns key derivation,
// expiration and invalidation so callers only describe what they want. A
// failing store degrades to direct computation rather than failing the caller.

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "green_coverage/cache_key.hpp"
#include "green_coverage/cache_payload.hpp"
#include "green_coverage/cache_store.hpp"
#include "green_coverage/expiration_policy.hpp"
#include "green_coverage/types.hpp"

namespace green_coverage {

/**
 * @brief Description of one cacheable computation.
 */
struct CacheRequest final {
    CalculationType type{CalculationType::satellite()};
    KeyParams key_params{};
    std::string city_name{};
    std::optional<std::int64_t> city_id{};
    std::optional<std::chrono::seconds> ttl_override{}; /**< Replaces the policy TTL for this write. */
};

using ComputeFn = std::function<CachePayload()>;

/**
 * @brief Result of a forced recomputation.
 */
struct RefreshOutcome final {
    CachePayload payload{};
    std::string cache_key{};
    bool cached{false}; /**< False when the store rejected the write. */
};

class CacheOrchestrator final {
  public:
    CacheOrchestrator(CacheStorePtr store, ExpirationPolicy policy, WallClockSource clock = system_wall_clock());

    /**
     * @brief Return the cached payload for `request` or compute, store and return it.
     *
     * Failures of `compute` propagate and nothing is cached. A payload whose
     * shape does not match `request.type` raises `std::invalid_argument`.
     */
    CachePayload get_or_compute(const CacheRequest& request, const ComputeFn& compute);

    /** @brief Typed convenience over `get_or_compute`. */
    template <typename Result>
    Result get_or_compute_as(const CacheRequest& request, const std::function<Result()>& compute) {
        CachePayload payload = get_or_compute(request, [&compute]() { return CachePayload{compute()}; });
        if (!std::holds_alternative<Result>(payload)) {
            throw std::invalid_argument("Cached payload type does not match the requested result type");
        }
        return std::get<Result>(std::move(payload));
    }

    /** @brief Always compute and overwrite the entry for `request`. */
    RefreshOutcome refresh(const CacheRequest& request, const ComputeFn& compute);

    /** @brief Remove every entry of `city_name`, optionally of one type only. */
    std::size_t invalidate(const std::string& city_name, const std::optional<CalculationType>& type = std::nullopt);

    /** @brief Remove `types` entries of `city_name` except `keep_key`. */
    std::size_t invalidate_stale(const std::string& city_name,
                                 const std::vector<CalculationType>& types,
                                 const std::string& keep_key);

    /** @brief Remove every entry of the given types across all cities. */
    std::size_t invalidate_types(const std::vector<CalculationType>& types);

    std::size_t sweep_expired();
    [[nodiscard]] CacheStats cache_stats();
    [[nodiscard]] std::vector<std::string> cached_cities();

    [[nodiscard]] std::string key_for(const CacheRequest& request) const;
    [[nodiscard]] const ExpirationPolicy& policy() const noexcept;

  private:
    std::optional<CachePayload> lookup(const std::string& key, const CacheRequest& request);
    CachePayload compute_checked(const CacheRequest& request, const ComputeFn& compute) const;
    bool write_back(const std::string& key, const CacheRequest& request, const CachePayload& payload);

    CacheStorePtr store_;
    ExpirationPolicy policy_;
    WallClockSource clock_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace green_coverage
