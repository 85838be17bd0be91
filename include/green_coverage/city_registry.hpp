// === City Registry & Imagery Catalog =========================================
//
// Population of cities the scheduler iterates and the lookup that pairs each
// city with its satellite raster and boundary file on disk.

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace green_coverage {

struct CityRecord final {
    std::int64_t id{};
    std::string name{};
};

/**
 * @brief Source of known cities.
 */
class CityRegistry {
  public:
    virtual ~CityRegistry() = default;

    [[nodiscard]] virtual std::vector<CityRecord> list_cities() const = 0;
    /** @brief Case-insensitive lookup by name. */
    [[nodiscard]] virtual std::optional<CityRecord> find_city(const std::string& name) const = 0;
};

using CityRegistryPtr = std::shared_ptr<CityRegistry>;

/**
 * @brief Fixed list of cities held in memory.
 */
class InMemoryCityRegistry final : public CityRegistry {
  public:
    explicit InMemoryCityRegistry(std::vector<CityRecord> cities);

    /**
     * @brief Load `id,name` lines; blank lines and `#` comments are skipped.
     *
     * @throws CoverageError(MissingInput) when the file cannot be opened,
     *         CoverageError(UnsupportedFormat) on a malformed line.
     */
    static std::shared_ptr<InMemoryCityRegistry> from_file(const std::filesystem::path& path);

    [[nodiscard]] std::vector<CityRecord> list_cities() const override;
    [[nodiscard]] std::optional<CityRecord> find_city(const std::string& name) const override;

  private:
    std::vector<CityRecord> list_cities_;
};

/**
 * @brief Raster and boundary file for one city.
 */
struct CityDataFiles final {
    std::filesystem::path raster_path{};
    std::filesystem::path boundary_path{};
};

/**
 * @brief Locates the input files of a city.
 */
class ImageryCatalog {
  public:
    virtual ~ImageryCatalog() = default;

    /** @brief Files for `city`, or empty when either one is missing. */
    [[nodiscard]] virtual std::optional<CityDataFiles> locate(const CityRecord& city) const = 0;
};

using ImageryCatalogPtr = std::shared_ptr<ImageryCatalog>;

/**
 * @brief Catalog scanning a satellite directory and a boundary directory.
 *
 * A file matches when its name contains the lower-cased city name with
 * spaces replaced by `_`, then `-`, then kept as-is. When no city-specific
 * file exists the first regional file of the right kind is used.
 */
class DirectoryImageryCatalog final : public ImageryCatalog {
  public:
    DirectoryImageryCatalog(std::filesystem::path satellite_directory, std::filesystem::path boundary_directory);

    [[nodiscard]] std::optional<CityDataFiles> locate(const CityRecord& city) const override;

  private:
    std::filesystem::path path_satellite_directory_;
    std::filesystem::path path_boundary_directory_;
};

}  // namespace green_coverage
