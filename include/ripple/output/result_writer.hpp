// ripple/output/result_writer.hpp - YAML / JSON serialization of analysis results
//
// Keys are camelCase and maps are emitted in component-name order, so the
// same result always serializes to the same bytes.
//
#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "ripple/impact/impact_result.hpp"

namespace ripple
{

enum class OutputFormat : uint8_t {
  Yaml,
  Json,
};

/// "yaml" or "json"; nullopt for anything else
[[nodiscard]] std::optional<OutputFormat> parse_output_format(const std::string & text);
[[nodiscard]] const char * to_string(OutputFormat format) noexcept;

[[nodiscard]] nlohmann::json to_json(const ImpactAnalysisResult & result);
[[nodiscard]] nlohmann::json to_json(const ImpactScores & scores);

[[nodiscard]] std::string write_result_yaml(const ImpactAnalysisResult & result);
[[nodiscard]] std::string write_result_json(const ImpactAnalysisResult & result);

[[nodiscard]] std::string write_result(const ImpactAnalysisResult & result, OutputFormat format);

/**
 * Serialize bare impact scores (component -> score).
 */
[[nodiscard]] std::string write_scores(const ImpactScores & scores, OutputFormat format);

}  // namespace ripple
