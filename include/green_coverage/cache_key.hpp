// === Cache Keys ==============================================================
//
// Deterministic cache keys: the calculation type and its parameters are
// serialized canonically (lexicographic member order) and hashed with
// SHA-256. File inputs enter the key through a digest of their bytes so a
// replaced raster or boundary never hits a stale entry.

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <variant>

#include "green_coverage/calculation_type.hpp"

namespace green_coverage {

/**
 * @brief Named scalar parameters of one computation.
 *
 * Integers and floating-point values are kept distinct, so `1` and `1.0`
 * produce different keys.
 */
class KeyParams final {
  public:
    using Value = std::variant<std::int64_t, double, bool, std::string>;

    KeyParams& set(std::string name, std::int64_t value);
    KeyParams& set(std::string name, int value);
    KeyParams& set(std::string name, double value);
    KeyParams& set(std::string name, bool value);
    KeyParams& set(std::string name, std::string value);
    KeyParams& set(std::string name, const char* value);

    /**
     * @brief Store the SHA-256 of the file at `path` under `name`.
     *
     * @throws CoverageError(MissingInput) when the file cannot be read.
     */
    KeyParams& set_file_digest(std::string name, const std::filesystem::path& path);

    [[nodiscard]] const std::map<std::string, Value>& values() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

    /** @brief Canonical JSON text of the parameters. */
    [[nodiscard]] std::string canonical() const;

  private:
    std::map<std::string, Value> map_values_;
};

/** @brief Lower-case hex SHA-256 of `data`. */
[[nodiscard]] std::string sha256_hex(std::string_view data);

/** @brief Lower-case hex SHA-256 of a file's bytes, read in chunks. */
[[nodiscard]] std::string file_sha256_hex(const std::filesystem::path& path);

/**
 * @brief 64-character hex key of `{calculation_type, params}`.
 */
[[nodiscard]] std::string derive_cache_key(const CalculationType& type, const KeyParams& params);

}  // namespace green_coverage
