// ripple/impact/impact_result.hpp - Output of a change impact analysis
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ripple
{

/// Final score per component, each in [0, 1]. Ordered by component name.
using ImpactScores = std::map<std::string, double>;

enum class RiskType : uint8_t {
  ContractCompliance,
  HighImpact,
  MediumImpact,
  LowImpact,
};

[[nodiscard]] std::string_view to_string(RiskType type) noexcept;

struct RiskArea
{
  std::string component;
  RiskType risk_type = RiskType::LowImpact;
  double risk_score = 0.0;
  std::string description;

  /// Affected contracts whose name starts with the component name
  std::vector<std::string> affected_contracts;
};

/**
 * Components grouped by impact tier.
 *
 * high >= 0.7, medium in [0.4, 0.7), low < 0.4. contracts echoes the
 * change's affected contracts and is only present when there are any.
 */
struct AffectedComponents
{
  std::vector<std::string> high;
  std::vector<std::string> medium;
  std::vector<std::string> low;
  std::optional<std::vector<std::string>> contracts;
};

struct ImpactAnalysisResult
{
  ImpactScores impact_scores;
  std::vector<RiskArea> risk_areas;
  std::vector<std::string> suggested_mitigations;
  AffectedComponents affected_components;
};

}  // namespace ripple
