// ripple/impact/mitigation_advisor.cpp - Remediation lookup table
#include "ripple/impact/mitigation_advisor.hpp"

#include <fmt/core.h>

#include <unordered_set>

namespace ripple
{

std::vector<std::string> MitigationAdvisor::suggestions_for(const RiskArea & area)
{
  const std::string & c = area.component;

  switch (area.risk_type) {
    case RiskType::ContractCompliance:
      return {
        fmt::format("Implement compatibility layer for {}", c),
        fmt::format("Add contract validation tests for {}", c),
      };
    case RiskType::HighImpact:
      return {
        fmt::format("Phase implementation for {}", c),
        fmt::format("Increase test coverage for {}", c),
        fmt::format("Prepare rollback procedure for {}", c),
      };
    case RiskType::MediumImpact:
      return {
        fmt::format("Monitor {} during deployment", c),
        fmt::format("Add performance tests for {}", c),
      };
    case RiskType::LowImpact:
      break;
  }
  return {};
}

std::vector<std::string> MitigationAdvisor::advise(gsl::span<const RiskArea> areas)
{
  std::vector<std::string> mitigations;
  std::unordered_set<std::string> seen;

  for (const auto & area : areas) {
    for (auto & suggestion : suggestions_for(area)) {
      if (seen.insert(suggestion).second) {
        mitigations.push_back(std::move(suggestion));
      }
    }
  }

  return mitigations;
}

}  // namespace ripple
