// ripple/output/result_writer.cpp - YAML / JSON serialization of analysis results
#include "ripple/output/result_writer.hpp"

#include <yaml-cpp/yaml.h>

#include <limits>
#include <vector>

namespace ripple
{
namespace
{

using nlohmann::json;

// ============================================================================
// JSON
// ============================================================================

json j_risk_area(const RiskArea & area)
{
  return json{
    {"component", area.component},
    {"riskType", std::string(to_string(area.risk_type))},
    {"riskScore", area.risk_score},
    {"description", area.description},
    {"affectedContracts", area.affected_contracts}};
}

json j_tiers(const AffectedComponents & tiers)
{
  json out{{"high", tiers.high}, {"medium", tiers.medium}, {"low", tiers.low}};
  if (tiers.contracts) {
    out["contracts"] = *tiers.contracts;
  }
  return out;
}

// ============================================================================
// YAML
// ============================================================================

void emit_names(YAML::Emitter & out, const std::vector<std::string> & names)
{
  out << YAML::BeginSeq;
  for (const auto & name : names) {
    out << name;
  }
  out << YAML::EndSeq;
}

void emit_scores(YAML::Emitter & out, const ImpactScores & scores)
{
  out << YAML::BeginMap;
  for (const auto & [component, score] : scores) {
    out << YAML::Key << component << YAML::Value << score;
  }
  out << YAML::EndMap;
}

void emit_risk_area(YAML::Emitter & out, const RiskArea & area)
{
  out << YAML::BeginMap;
  out << YAML::Key << "component" << YAML::Value << area.component;
  out << YAML::Key << "riskType" << YAML::Value << std::string(to_string(area.risk_type));
  out << YAML::Key << "riskScore" << YAML::Value << area.risk_score;
  out << YAML::Key << "description" << YAML::Value << area.description;
  out << YAML::Key << "affectedContracts" << YAML::Value;
  emit_names(out, area.affected_contracts);
  out << YAML::EndMap;
}

void emit_tiers(YAML::Emitter & out, const AffectedComponents & tiers)
{
  out << YAML::BeginMap;
  out << YAML::Key << "high" << YAML::Value;
  emit_names(out, tiers.high);
  out << YAML::Key << "medium" << YAML::Value;
  emit_names(out, tiers.medium);
  out << YAML::Key << "low" << YAML::Value;
  emit_names(out, tiers.low);
  if (tiers.contracts) {
    out << YAML::Key << "contracts" << YAML::Value;
    emit_names(out, *tiers.contracts);
  }
  out << YAML::EndMap;
}

void configure(YAML::Emitter & out)
{
  // 15 significant digits: 0.65 prints as 0.65
  out.SetDoublePrecision(std::numeric_limits<double>::digits10);
}

std::string finish(const YAML::Emitter & out) { return std::string(out.c_str()) + "\n"; }

}  // namespace

std::optional<OutputFormat> parse_output_format(const std::string & text)
{
  if (text == "yaml") {
    return OutputFormat::Yaml;
  }
  if (text == "json") {
    return OutputFormat::Json;
  }
  return std::nullopt;
}

const char * to_string(OutputFormat format) noexcept
{
  switch (format) {
    case OutputFormat::Yaml:
      return "yaml";
    case OutputFormat::Json:
      return "json";
  }
  return "yaml";
}

nlohmann::json to_json(const ImpactScores & scores)
{
  json out = json::object();
  for (const auto & [component, score] : scores) {
    out[component] = score;
  }
  return out;
}

nlohmann::json to_json(const ImpactAnalysisResult & result)
{
  json areas = json::array();
  for (const auto & area : result.risk_areas) {
    areas.push_back(j_risk_area(area));
  }

  return json{
    {"impactScores", to_json(result.impact_scores)},
    {"riskAreas", areas},
    {"suggestedMitigations", result.suggested_mitigations},
    {"affectedComponents", j_tiers(result.affected_components)}};
}

std::string write_result_yaml(const ImpactAnalysisResult & result)
{
  YAML::Emitter out;
  configure(out);

  out << YAML::BeginMap;

  out << YAML::Key << "impactScores" << YAML::Value;
  emit_scores(out, result.impact_scores);

  out << YAML::Key << "riskAreas" << YAML::Value << YAML::BeginSeq;
  for (const auto & area : result.risk_areas) {
    emit_risk_area(out, area);
  }
  out << YAML::EndSeq;

  out << YAML::Key << "suggestedMitigations" << YAML::Value;
  emit_names(out, result.suggested_mitigations);

  out << YAML::Key << "affectedComponents" << YAML::Value;
  emit_tiers(out, result.affected_components);

  out << YAML::EndMap;
  return finish(out);
}

std::string write_result_json(const ImpactAnalysisResult & result)
{
  return to_json(result).dump(2) + "\n";
}

std::string write_result(const ImpactAnalysisResult & result, OutputFormat format)
{
  return format == OutputFormat::Json ? write_result_json(result) : write_result_yaml(result);
}

std::string write_scores(const ImpactScores & scores, OutputFormat format)
{
  if (format == OutputFormat::Json) {
    return to_json(scores).dump(2) + "\n";
  }
  YAML::Emitter out;
  configure(out);
  emit_scores(out, scores);
  return finish(out);
}

}  // namespace ripple
