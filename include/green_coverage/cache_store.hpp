// === Cache Store =============================================================
//
// Durable key -> entry mapping with per-entry expiration. The store treats
// payloads as opaque text; typing lives in the orchestrator. Expired entries
// are misses on read even before a sweep removes them.

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sqlite3.h>

#include "green_coverage/calculation_type.hpp"
#include "green_coverage/types.hpp"

namespace green_coverage {

/**
 * @brief One cached computation.
 */
struct CacheEntry final {
    std::string cache_key{};
    CalculationType calculation_type{CalculationType::satellite()};
    std::optional<std::int64_t> city_id{};
    std::string city_name{};
    std::string payload{};
    WallTime created_at{};
    WallTime expires_at{};
};

/**
 * @brief Selects entries of one city for deletion.
 */
struct InvalidationFilter final {
    std::string city_name{};                         /**< Matched case-insensitively. */
    std::vector<CalculationType> types{};            /**< Empty means every type. */
    std::optional<std::string> preserve_key{};       /**< Entry to keep even if it matches. */
};

/**
 * @brief Entry counts at a point in time.
 */
struct CacheStats final {
    std::size_t total_entries{};
    std::size_t valid_entries{};
    std::size_t expired_entries{};
    std::map<std::string, std::size_t> by_type{}; /**< Valid entries per calculation type. */
};

/**
 * @brief Abstract persistence substrate. Failures surface as
 *        `CoverageError(CacheUnavailable)`.
 */
class CacheStore {
  public:
    virtual ~CacheStore() = default;

    /** @brief Insert or atomically replace the entry with the same key. */
    virtual void put(const CacheEntry& entry) = 0;
    /** @brief Entry for `key` unless absent or expired at `now`. */
    [[nodiscard]] virtual std::optional<CacheEntry> get(const std::string& key, WallTime now) = 0;
    virtual bool erase(const std::string& key) = 0;
    /** @brief Remove entries expired at `now`, optionally only for one city. */
    virtual std::size_t delete_expired(WallTime now, const std::optional<std::string>& city_name = std::nullopt) = 0;
    virtual std::size_t delete_by_city(const InvalidationFilter& filter) = 0;
    virtual std::size_t delete_by_types(const std::vector<CalculationType>& types) = 0;
    [[nodiscard]] virtual CacheStats stats(WallTime now) = 0;
    /** @brief Distinct city names with at least one entry. */
    [[nodiscard]] virtual std::vector<std::string> cached_cities() = 0;
};

using CacheStorePtr = std::shared_ptr<CacheStore>;

/**
 * @brief Stand-in for a store that could not be opened.
 *
 * Every operation raises `CacheUnavailable` carrying the original failure, so
 * callers degrade to direct computation.
 */
class UnavailableCacheStore final : public CacheStore {
  public:
    explicit UnavailableCacheStore(std::string reason);

    void put(const CacheEntry& entry) override;
    [[nodiscard]] std::optional<CacheEntry> get(const std::string& key, WallTime now) override;
    bool erase(const std::string& key) override;
    std::size_t delete_expired(WallTime now, const std::optional<std::string>& city_name = std::nullopt) override;
    std::size_t delete_by_city(const InvalidationFilter& filter) override;
    std::size_t delete_by_types(const std::vector<CalculationType>& types) override;
    [[nodiscard]] CacheStats stats(WallTime now) override;
    [[nodiscard]] std::vector<std::string> cached_cities() override;

  private:
    [[noreturn]] void fail() const;

    std::string str_reason_;
};

/**
 * @brief SQLite-backed store holding a single connection behind a mutex.
 */
class SqliteCacheStore final : public CacheStore {
  public:
    /**
     * @brief Open (creating if needed) the database at `database_path`.
     *
     * `:memory:` opens a private in-memory database.
     */
    explicit SqliteCacheStore(const std::string& database_path);

    void put(const CacheEntry& entry) override;
    [[nodiscard]] std::optional<CacheEntry> get(const std::string& key, WallTime now) override;
    bool erase(const std::string& key) override;
    std::size_t delete_expired(WallTime now, const std::optional<std::string>& city_name = std::nullopt) override;
    std::size_t delete_by_city(const InvalidationFilter& filter) override;
    std::size_t delete_by_types(const std::vector<CalculationType>& types) override;
    [[nodiscard]] CacheStats stats(WallTime now) override;
    [[nodiscard]] std::vector<std::string> cached_cities() override;

  private:
    struct ConnectionDeleter final {
        void operator()(sqlite3* connection) const noexcept {
            sqlite3_close_v2(connection);
        }
    };

    void execute(const std::string& sql);
    void initialize_schema();

    std::string str_database_path_;
    std::unique_ptr<sqlite3, ConnectionDeleter> connection_;
    std::mutex mutex_;
};

}  // namespace green_coverage
