#include <fstream>
#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

#include "green_coverage/cache_key.hpp"
#include "green_coverage/errors.hpp"
#include "test_fixtures.hpp"

using namespace green_coverage;

namespace {

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream stream{path, std::ios::binary | std::ios::trunc};
    stream << content;
}

}  // namespace

TEST_CASE("sha256_hex matches the published test vector") {
    REQUIRE(sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("Cache keys are 64 lower-case hex characters") {
    const std::string key = derive_cache_key(CalculationType::satellite(), KeyParams{}.set("city_name", "Alpha"));
    REQUIRE(key.size() == 64);
    REQUIRE(key.find_first_not_of("0123456789abcdef") == std::string::npos);
}

TEST_CASE("Cache keys ignore parameter insertion order") {
    KeyParams forward{};
    forward.set("city_name", "Alpha").set("ndvi_threshold", 0.3).set("year", 2023);
    KeyParams backward{};
    backward.set("year", 2023).set("ndvi_threshold", 0.3).set("city_name", "Alpha");

    REQUIRE(forward.canonical() == backward.canonical());
    REQUIRE(derive_cache_key(CalculationType::satellite(), forward) == derive_cache_key(CalculationType::satellite(), backward));
}

TEST_CASE("Cache keys change with any parameter or the calculation type") {
    KeyParams base{};
    base.set("city_name", "Alpha").set("ndvi_threshold", 0.3);
    KeyParams other_threshold{};
    other_threshold.set("city_name", "Alpha").set("ndvi_threshold", 0.4);

    const std::string key = derive_cache_key(CalculationType::satellite(), base);
    REQUIRE(key != derive_cache_key(CalculationType::satellite(), other_threshold));
    REQUIRE(key != derive_cache_key(CalculationType::stats(), base));
    REQUIRE(key != derive_cache_key(CalculationType::custom("tree_canopy"), base));
}

TEST_CASE("Integer and floating-point parameters produce different keys") {
    KeyParams integer{};
    integer.set("band", 1);
    KeyParams floating{};
    floating.set("band", 1.0);

    REQUIRE(derive_cache_key(CalculationType::satellite(), integer) != derive_cache_key(CalculationType::satellite(), floating));
}

TEST_CASE("File digests track file contents rather than paths") {
    const auto directory = test::make_temp_directory("green_coverage_key");
    const auto raster = directory / "alpha.tif";
    write_file(raster, "first version");

    KeyParams params{};
    params.set_file_digest("raster_hash", raster);
    const std::string before = derive_cache_key(CalculationType::satellite(), params);

    KeyParams same{};
    same.set_file_digest("raster_hash", raster);
    REQUIRE(derive_cache_key(CalculationType::satellite(), same) == before);

    write_file(raster, "second version");
    KeyParams after{};
    after.set_file_digest("raster_hash", raster);
    REQUIRE(derive_cache_key(CalculationType::satellite(), after) != before);

    std::filesystem::remove_all(directory);
}

TEST_CASE("Unreadable files cannot be hashed") {
    KeyParams params{};
    try {
        params.set_file_digest("raster_hash", "/nonexistent/green_coverage/missing.tif");
        FAIL("expected MissingInput");
    } catch (const CoverageError& error) {
        REQUIRE(error.kind() == ErrorKind::MissingInput);
    }
}

TEST_CASE("Custom calculation tags cannot shadow built-in types") {
    REQUIRE_THROWS_AS(CalculationType::custom(""), std::invalid_argument);
    REQUIRE_THROWS_AS(CalculationType::custom("stats"), std::invalid_argument);
    REQUIRE(CalculationType::parse("satellite") == CalculationType::satellite());
    REQUIRE(CalculationType::parse("tree_canopy") == CalculationType::custom("tree_canopy"));
    REQUIRE(CalculationType::parse("tree_canopy").kind() == CalculationType::Kind::Custom);
}
