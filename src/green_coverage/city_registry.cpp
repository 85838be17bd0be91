#include "green_coverage/city_registry.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "green_coverage/errors.hpp"
#include "green_coverage/logging.hpp"

namespace green_coverage {

namespace {

constexpr std::array<std::string_view, 2> k_raster_suffixes{".tif", ".tiff"};
constexpr std::array<std::string_view, 2> k_boundary_suffixes{".shp", ".geojson"};

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::vector<std::string> city_patterns(const std::string& city_name) {
    const std::string lowered = to_lower(city_name);
    std::string underscored = lowered;
    std::replace(underscored.begin(), underscored.end(), ' ', '_');
    std::string hyphenated = lowered;
    std::replace(hyphenated.begin(), hyphenated.end(), ' ', '-');

    std::vector<std::string> patterns{underscored};
    for (const std::string& candidate : {hyphenated, lowered}) {
        if (std::find(patterns.begin(), patterns.end(), candidate) == patterns.end()) {
            patterns.push_back(candidate);
        }
    }
    return patterns;
}

/**
 * @brief Regular files in `directory` with one of `suffixes`, sorted by name.
 */
template <std::size_t N>
std::vector<std::filesystem::path> list_files(const std::filesystem::path& directory,
                                              const std::array<std::string_view, N>& suffixes) {
    std::vector<std::filesystem::path> files;
    std::error_code error_iterate;
    if (!std::filesystem::is_directory(directory, error_iterate)) {
        return files;
    }
    for (const auto& entry : std::filesystem::directory_iterator(directory, error_iterate)) {
        if (!entry.is_regular_file(error_iterate)) {
            continue;
        }
        const std::string extension = to_lower(entry.path().extension().string());
        if (std::find(suffixes.begin(), suffixes.end(), extension) != suffixes.end()) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

/**
 * @brief First file matching a city pattern, honouring pattern then suffix order.
 */
template <std::size_t N>
std::optional<std::filesystem::path> find_city_file(const std::vector<std::filesystem::path>& files,
                                                    const std::vector<std::string>& patterns,
                                                    const std::array<std::string_view, N>& suffixes) {
    for (const std::string& pattern : patterns) {
        for (const std::string_view suffix : suffixes) {
            for (const std::filesystem::path& file : files) {
                const std::string file_name = to_lower(file.filename().string());
                if (to_lower(file.extension().string()) == suffix && file_name.find(pattern) != std::string::npos) {
                    return file;
                }
            }
        }
    }
    if (!files.empty()) {
        return files.front();
    }
    return std::nullopt;
}

}  // namespace

InMemoryCityRegistry::InMemoryCityRegistry(std::vector<CityRecord> cities)
    : list_cities_(std::move(cities)) {}

std::shared_ptr<InMemoryCityRegistry> InMemoryCityRegistry::from_file(const std::filesystem::path& path) {
    std::ifstream stream{path};
    if (!stream) {
        throw CoverageError(ErrorKind::MissingInput, "Cannot open city list " + path.string());
    }

    std::vector<CityRecord> cities;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(stream, line)) {
        ++line_number;
        const std::string content = trim(line);
        if (content.empty() || content.front() == '#') {
            continue;
        }
        const auto separator = content.find(',');
        if (separator == std::string::npos) {
            throw CoverageError(
                ErrorKind::UnsupportedFormat,
                fmt::format("{}:{}: expected 'id,name'", path.string(), line_number)
            );
        }
        CityRecord record{};
        try {
            record.id = std::stoll(trim(content.substr(0, separator)));
        } catch (const std::exception&) {
            throw CoverageError(
                ErrorKind::UnsupportedFormat,
                fmt::format("{}:{}: city id is not an integer", path.string(), line_number)
            );
        }
        record.name = trim(content.substr(separator + 1));
        if (record.name.empty()) {
            throw CoverageError(
                ErrorKind::UnsupportedFormat,
                fmt::format("{}:{}: city name is empty", path.string(), line_number)
            );
        }
        cities.push_back(std::move(record));
    }
    get_logger()->info("Loaded {} cities from {}", cities.size(), path.string());
    return std::make_shared<InMemoryCityRegistry>(std::move(cities));
}

std::vector<CityRecord> InMemoryCityRegistry::list_cities() const {
    return list_cities_;
}

std::optional<CityRecord> InMemoryCityRegistry::find_city(const std::string& name) const {
    const std::string needle = to_lower(trim(name));
    for (const CityRecord& city : list_cities_) {
        if (to_lower(city.name) == needle) {
            return city;
        }
    }
    return std::nullopt;
}

DirectoryImageryCatalog::DirectoryImageryCatalog(std::filesystem::path satellite_directory,
                                                 std::filesystem::path boundary_directory)
    : path_satellite_directory_(std::move(satellite_directory)),
      path_boundary_directory_(std::move(boundary_directory)) {}

std::optional<CityDataFiles> DirectoryImageryCatalog::locate(const CityRecord& city) const {
    const std::vector<std::string> patterns = city_patterns(city.name);
    const auto raster = find_city_file(list_files(path_satellite_directory_, k_raster_suffixes), patterns, k_raster_suffixes);
    const auto boundary = find_city_file(list_files(path_boundary_directory_, k_boundary_suffixes), patterns, k_boundary_suffixes);
    if (!raster.has_value() || !boundary.has_value()) {
        return std::nullopt;
    }
    return CityDataFiles{raster.value(), boundary.value()};
}

}  // namespace green_coverage
