// === Cache Payload ===========================================================
//
// Tagged union of everything the cache holds, and its JSON text encoding.
// Each calculation type admits exactly one payload shape.

#pragma once

#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "green_coverage/calculation_type.hpp"
#include "green_coverage/coverage_assessment.hpp"
#include "green_coverage/ndvi_analyzer.hpp"

namespace green_coverage {

/** @brief Free-form document for caller-defined calculation types. */
struct CustomPayload final {
    nlohmann::json document{};
};

/**
 * @brief Payload of a cache entry.
 *
 * `satellite` holds a CoverageResult, `stats` a CoverageComparison, `stored`
 * a StoredCoverage and custom tags a CustomPayload.
 */
using CachePayload = std::variant<CoverageResult, CoverageComparison, StoredCoverage, CustomPayload>;

[[nodiscard]] bool payload_matches(const CalculationType& type, const CachePayload& payload) noexcept;

[[nodiscard]] std::string encode_payload(const CachePayload& payload);

/**
 * @brief Decode a stored payload for `type`.
 *
 * @throws std::invalid_argument when the text is not valid JSON or lacks a
 *         field the shape requires.
 */
[[nodiscard]] CachePayload decode_payload(const CalculationType& type, const std::string& encoded);

void to_json(nlohmann::json& document, const CoverageResult& result);
void from_json(const nlohmann::json& document, CoverageResult& result);
void to_json(nlohmann::json& document, const CoverageComparison& comparison);
void from_json(const nlohmann::json& document, CoverageComparison& comparison);
void to_json(nlohmann::json& document, const StoredCoverage& stored);
void from_json(const nlohmann::json& document, StoredCoverage& stored);

}  // namespace green_coverage
