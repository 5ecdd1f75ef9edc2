// ripple/impact/mitigation_advisor.hpp - Canned remediation suggestions per risk tier
#pragma once

#include <gsl/span>
#include <string>
#include <vector>

#include "ripple/impact/impact_result.hpp"

namespace ripple
{

class MitigationAdvisor
{
public:
  /**
   * Suggestions for a single risk area. LowImpact areas get none.
   */
  [[nodiscard]] static std::vector<std::string> suggestions_for(const RiskArea & area);

  /**
   * Suggestions for all risk areas, deduplicated, in first-seen order.
   */
  [[nodiscard]] static std::vector<std::string> advise(gsl::span<const RiskArea> areas);
};

}  // namespace ripple
