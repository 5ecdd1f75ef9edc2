// ripple/impact/risk_classifier.hpp - Threshold-based risk tiers
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "ripple/impact/change_spec.hpp"
#include "ripple/impact/impact_result.hpp"

namespace ripple
{

struct RiskThresholds
{
  /// Minimum score for a component to be reported as a risk area
  double risk = 0.6;
  double medium = 0.4;
  double high = 0.7;
};

class RiskClassifier
{
public:
  explicit RiskClassifier(RiskThresholds thresholds = {}) : thresholds_(thresholds) {}

  /**
   * Derive risk areas for every component scoring at least the risk threshold.
   *
   * Components named in the change's affected contracts are not reported
   * unless their score clears the threshold as well.
   */
  [[nodiscard]] std::vector<RiskArea> classify(
    const ImpactScores & scores, const ChangeSpecification & change) const;

  [[nodiscard]] RiskType risk_type_for(
    std::string_view component, double score, const ChangeSpecification & change) const;

  [[nodiscard]] std::string describe(std::string_view component, double score) const;

  /**
   * Group every scored component into high / medium / low tiers.
   */
  [[nodiscard]] AffectedComponents group_by_tier(
    const ImpactScores & scores, const ChangeSpecification & change) const;

  [[nodiscard]] const RiskThresholds & thresholds() const noexcept { return thresholds_; }

private:
  RiskThresholds thresholds_;
};

}  // namespace ripple
