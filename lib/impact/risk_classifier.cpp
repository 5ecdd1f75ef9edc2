// ripple/impact/risk_classifier.cpp - Risk tier classification
#include "ripple/impact/risk_classifier.hpp"

#include <fmt/core.h>

namespace ripple
{

std::vector<RiskArea> RiskClassifier::classify(
  const ImpactScores & scores, const ChangeSpecification & change) const
{
  std::vector<RiskArea> areas;

  for (const auto & [component, score] : scores) {
    if (score < thresholds_.risk) {
      continue;
    }

    RiskArea area;
    area.component = component;
    area.risk_score = score;
    area.risk_type = risk_type_for(component, score, change);
    area.description = describe(component, score);

    // Loose match: a contract belongs to the component when its name starts
    // with the component name.
    for (const auto & contract : change.affected_contracts) {
      if (contract.compare(0, component.size(), component) == 0) {
        area.affected_contracts.push_back(contract);
      }
    }

    areas.push_back(std::move(area));
  }

  return areas;
}

RiskType RiskClassifier::risk_type_for(
  std::string_view component, double score, const ChangeSpecification & change) const
{
  if (change.affects_contract(component)) {
    return RiskType::ContractCompliance;
  }
  if (score >= thresholds_.high) {
    return RiskType::HighImpact;
  }
  if (score >= thresholds_.medium) {
    return RiskType::MediumImpact;
  }
  // Unreachable while risk >= medium, kept for other threshold settings.
  return RiskType::LowImpact;
}

std::string RiskClassifier::describe(std::string_view component, double score) const
{
  if (score >= thresholds_.high) {
    return fmt::format("High risk of breaking changes affecting {}", component);
  }
  if (score >= thresholds_.medium) {
    return fmt::format("Potential indirect effects on {}", component);
  }
  return fmt::format("Minor impact possible on {}", component);
}

AffectedComponents RiskClassifier::group_by_tier(
  const ImpactScores & scores, const ChangeSpecification & change) const
{
  AffectedComponents tiers;

  for (const auto & [component, score] : scores) {
    if (score >= thresholds_.high) {
      tiers.high.push_back(component);
    } else if (score >= thresholds_.medium) {
      tiers.medium.push_back(component);
    } else {
      tiers.low.push_back(component);
    }
  }

  if (!change.affected_contracts.empty()) {
    tiers.contracts = change.affected_contracts;
  }

  return tiers;
}

}  // namespace ripple
