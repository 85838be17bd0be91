// === SQLite Cache Store ======================================================
//
// Persists cache entries in one `coverage_cache` table keyed by cache key.
// Timestamps are stored as epoch milliseconds so expiry comparisons happen in
// SQL. Every SQLite failure is converted into CoverageError(CacheUnavailable)
// at this boundary; callers never see raw result codes.

#include "green_coverage/cache_store.hpp"

#include <filesystem>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "green_coverage/errors.hpp"
#include "green_coverage/logging.hpp"

namespace green_coverage {

namespace {

constexpr int k_busy_timeout_ms{5000};
constexpr char k_memory_database[] = ":memory:";

constexpr char k_schema_sql[] = R"sql(
CREATE TABLE IF NOT EXISTS coverage_cache (
    cache_key        TEXT PRIMARY KEY NOT NULL,
    calculation_type TEXT NOT NULL,
    city_id          INTEGER,
    city_name        TEXT NOT NULL,
    payload          TEXT NOT NULL,
    created_at       INTEGER NOT NULL,
    expires_at       INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_coverage_cache_city ON coverage_cache (city_name COLLATE NOCASE);
CREATE INDEX IF NOT EXISTS idx_coverage_cache_expires ON coverage_cache (expires_at);
CREATE INDEX IF NOT EXISTS idx_coverage_cache_type ON coverage_cache (calculation_type);
)sql";

[[noreturn]] void throw_unavailable(sqlite3* connection, const std::string& operation) {
    const char* message = connection != nullptr ? sqlite3_errmsg(connection) : "no connection";
    throw CoverageError(
        ErrorKind::CacheUnavailable,
        fmt::format("Cache store {} failed: {}", operation, message)
    );
}

/**
 * @brief Prepared statement finalized on scope exit.
 */
class Statement final {
  public:
    Statement(sqlite3* connection, const std::string& sql)
        : connection_(connection) {
        if (sqlite3_prepare_v2(connection_, sql.c_str(), -1, &statement_, nullptr) != SQLITE_OK) {
            throw_unavailable(connection_, "prepare");
        }
    }

    ~Statement() {
        sqlite3_finalize(statement_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& value) {
        check(sqlite3_bind_text(statement_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT), "bind");
    }

    void bind(int index, std::int64_t value) {
        check(sqlite3_bind_int64(statement_, index, value), "bind");
    }

    void bind_null(int index) {
        check(sqlite3_bind_null(statement_, index), "bind");
    }

    /** @brief Advance; true while a row is available. */
    bool step() {
        const int result = sqlite3_step(statement_);
        if (result == SQLITE_ROW) {
            return true;
        }
        if (result == SQLITE_DONE) {
            return false;
        }
        throw_unavailable(connection_, "step");
    }

    [[nodiscard]] std::string column_text(int index) const {
        const unsigned char* text = sqlite3_column_text(statement_, index);
        return text != nullptr ? reinterpret_cast<const char*>(text) : std::string{};
    }

    [[nodiscard]] std::int64_t column_int64(int index) const {
        return sqlite3_column_int64(statement_, index);
    }

    [[nodiscard]] bool column_is_null(int index) const {
        return sqlite3_column_type(statement_, index) == SQLITE_NULL;
    }

  private:
    void check(int result, const char* operation) {
        if (result != SQLITE_OK) {
            throw_unavailable(connection_, operation);
        }
    }

    sqlite3* connection_;
    sqlite3_stmt* statement_{nullptr};
};

std::string placeholders(int first_index, std::size_t count) {
    std::string text;
    for (std::size_t offset = 0; offset < count; ++offset) {
        if (offset > 0) {
            text += ", ";
        }
        text += fmt::format("?{}", first_index + static_cast<int>(offset));
    }
    return text;
}

}  // namespace

SqliteCacheStore::SqliteCacheStore(const std::string& database_path)
    : str_database_path_(database_path) {
    const bool in_memory = database_path == k_memory_database;
    if (!in_memory) {
        const std::filesystem::path parent = std::filesystem::path{database_path}.parent_path();
        if (!parent.empty()) {
            std::error_code error_directory;
            std::filesystem::create_directories(parent, error_directory);
            if (error_directory) {
                throw CoverageError(ErrorKind::CacheUnavailable, "Unable to create cache directory " + parent.string());
            }
        }
    }

    sqlite3* raw_connection = nullptr;
    const int result = sqlite3_open_v2(
        database_path.c_str(),
        &raw_connection,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr
    );
    connection_.reset(raw_connection);
    if (result != SQLITE_OK) {
        throw_unavailable(connection_.get(), "open " + database_path);
    }
    sqlite3_busy_timeout(connection_.get(), k_busy_timeout_ms);
    if (!in_memory) {
        execute("PRAGMA journal_mode=WAL;");
    }
    initialize_schema();
    get_logger()->info("Cache store ready at {}", database_path);
}

void SqliteCacheStore::execute(const std::string& sql) {
    char* raw_error = nullptr;
    if (sqlite3_exec(connection_.get(), sql.c_str(), nullptr, nullptr, &raw_error) != SQLITE_OK) {
        const std::string message = raw_error != nullptr ? raw_error : "unknown error";
        sqlite3_free(raw_error);
        throw CoverageError(ErrorKind::CacheUnavailable, "Cache store statement failed: " + message);
    }
}

void SqliteCacheStore::initialize_schema() {
    execute(k_schema_sql);
}

void SqliteCacheStore::put(const CacheEntry& entry) {
    std::scoped_lock lock(mutex_);
    Statement statement{connection_.get(), R"sql(
        INSERT INTO coverage_cache (cache_key, calculation_type, city_id, city_name, payload, created_at, expires_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)
        ON CONFLICT(cache_key) DO UPDATE SET
            calculation_type = excluded.calculation_type,
            city_id = excluded.city_id,
            city_name = excluded.city_name,
            payload = excluded.payload,
            created_at = excluded.created_at,
            expires_at = excluded.expires_at
    )sql"};
    statement.bind(1, entry.cache_key);
    statement.bind(2, entry.calculation_type.name());
    if (entry.city_id.has_value()) {
        statement.bind(3, entry.city_id.value());
    } else {
        statement.bind_null(3);
    }
    statement.bind(4, entry.city_name);
    statement.bind(5, entry.payload);
    statement.bind(6, to_epoch_ms(entry.created_at));
    statement.bind(7, to_epoch_ms(entry.expires_at));
    statement.step();
}

std::optional<CacheEntry> SqliteCacheStore::get(const std::string& key, WallTime now) {
    std::scoped_lock lock(mutex_);
    CacheEntry entry{};
    std::string str_type_name;
    {
        Statement statement{connection_.get(), R"sql(
            SELECT cache_key, calculation_type, city_id, city_name, payload, created_at, expires_at
            FROM coverage_cache
            WHERE cache_key = ?1 AND expires_at > ?2
        )sql"};
        statement.bind(1, key);
        statement.bind(2, to_epoch_ms(now));
        if (!statement.step()) {
            return std::nullopt;
        }
        entry.cache_key = statement.column_text(0);
        str_type_name = statement.column_text(1);
        if (!statement.column_is_null(2)) {
            entry.city_id = statement.column_int64(2);
        }
        entry.city_name = statement.column_text(3);
        entry.payload = statement.column_text(4);
        entry.created_at = from_epoch_ms(statement.column_int64(5));
        entry.expires_at = from_epoch_ms(statement.column_int64(6));
    }

    try {
        entry.calculation_type = CalculationType::parse(str_type_name);
    } catch (const std::invalid_argument& exc) {
        // Rows the engine cannot type are dropped and read as misses.
        log_event(spdlog::level::warn, "cache", "corrupt_row", {{"key", key}, {"error", exc.what()}});
        Statement removal{connection_.get(), "DELETE FROM coverage_cache WHERE cache_key = ?1"};
        removal.bind(1, key);
        removal.step();
        return std::nullopt;
    }
    return entry;
}

bool SqliteCacheStore::erase(const std::string& key) {
    std::scoped_lock lock(mutex_);
    Statement statement{connection_.get(), "DELETE FROM coverage_cache WHERE cache_key = ?1"};
    statement.bind(1, key);
    statement.step();
    return sqlite3_changes(connection_.get()) > 0;
}

std::size_t SqliteCacheStore::delete_expired(WallTime now, const std::optional<std::string>& city_name) {
    std::scoped_lock lock(mutex_);
    std::string sql = "DELETE FROM coverage_cache WHERE expires_at <= ?1";
    if (city_name.has_value()) {
        sql += " AND city_name = ?2 COLLATE NOCASE";
    }
    Statement statement{connection_.get(), sql};
    statement.bind(1, to_epoch_ms(now));
    if (city_name.has_value()) {
        statement.bind(2, city_name.value());
    }
    statement.step();
    return static_cast<std::size_t>(sqlite3_changes(connection_.get()));
}

std::size_t SqliteCacheStore::delete_by_city(const InvalidationFilter& filter) {
    std::scoped_lock lock(mutex_);
    std::string sql = "DELETE FROM coverage_cache WHERE city_name = ?1 COLLATE NOCASE";
    int next_index = 2;
    if (filter.preserve_key.has_value()) {
        sql += " AND cache_key <> ?2";
        next_index = 3;
    }
    if (!filter.types.empty()) {
        sql += " AND calculation_type IN (" + placeholders(next_index, filter.types.size()) + ")";
    }

    Statement statement{connection_.get(), sql};
    statement.bind(1, filter.city_name);
    if (filter.preserve_key.has_value()) {
        statement.bind(2, filter.preserve_key.value());
    }
    for (std::size_t offset = 0; offset < filter.types.size(); ++offset) {
        statement.bind(next_index + static_cast<int>(offset), filter.types[offset].name());
    }
    statement.step();
    return static_cast<std::size_t>(sqlite3_changes(connection_.get()));
}

std::size_t SqliteCacheStore::delete_by_types(const std::vector<CalculationType>& types) {
    if (types.empty()) {
        return 0;
    }
    std::scoped_lock lock(mutex_);
    Statement statement{
        connection_.get(),
        "DELETE FROM coverage_cache WHERE calculation_type IN (" + placeholders(1, types.size()) + ")"
    };
    for (std::size_t offset = 0; offset < types.size(); ++offset) {
        statement.bind(1 + static_cast<int>(offset), types[offset].name());
    }
    statement.step();
    return static_cast<std::size_t>(sqlite3_changes(connection_.get()));
}

CacheStats SqliteCacheStore::stats(WallTime now) {
    std::scoped_lock lock(mutex_);
    Statement statement{connection_.get(), R"sql(
        SELECT calculation_type, expires_at > ?1 AS is_valid, COUNT(*)
        FROM coverage_cache
        GROUP BY calculation_type, is_valid
    )sql"};
    statement.bind(1, to_epoch_ms(now));

    CacheStats stats{};
    for (const CalculationType& type : {CalculationType::satellite(), CalculationType::stats(), CalculationType::stored()}) {
        stats.by_type[type.name()] = 0;
    }
    while (statement.step()) {
        const std::string type_name = statement.column_text(0);
        const bool is_valid = statement.column_int64(1) != 0;
        const auto count = static_cast<std::size_t>(statement.column_int64(2));
        stats.total_entries += count;
        if (is_valid) {
            stats.valid_entries += count;
            stats.by_type[type_name] += count;
        } else {
            stats.expired_entries += count;
        }
    }
    return stats;
}

std::vector<std::string> SqliteCacheStore::cached_cities() {
    std::scoped_lock lock(mutex_);
    Statement statement{connection_.get(), "SELECT DISTINCT city_name FROM coverage_cache ORDER BY city_name"};
    std::vector<std::string> cities;
    while (statement.step()) {
        cities.push_back(statement.column_text(0));
    }
    return cities;
}

UnavailableCacheStore::UnavailableCacheStore(std::string reason)
    : str_reason_(std::move(reason)) {}

void UnavailableCacheStore::fail() const {
    throw CoverageError(ErrorKind::CacheUnavailable, "Cache store unavailable: " + str_reason_);
}

void UnavailableCacheStore::put(const CacheEntry&) {
    fail();
}

std::optional<CacheEntry> UnavailableCacheStore::get(const std::string&, WallTime) {
    fail();
}

bool UnavailableCacheStore::erase(const std::string&) {
    fail();
}

std::size_t UnavailableCacheStore::delete_expired(WallTime, const std::optional<std::string>&) {
    fail();
}

std::size_t UnavailableCacheStore::delete_by_city(const InvalidationFilter&) {
    fail();
}

std::size_t UnavailableCacheStore::delete_by_types(const std::vector<CalculationType>&) {
    fail();
}

CacheStats UnavailableCacheStore::stats(WallTime) {
    fail();
}

std::vector<std::string> UnavailableCacheStore::cached_cities() {
    fail();
}

}  // namespace green_coverage
