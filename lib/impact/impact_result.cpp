// ripple/impact/impact_result.cpp
#include "ripple/impact/impact_result.hpp"

namespace ripple
{

std::string_view to_string(RiskType type) noexcept
{
  switch (type) {
    case RiskType::ContractCompliance:
      return "ContractCompliance";
    case RiskType::HighImpact:
      return "HighImpact";
    case RiskType::MediumImpact:
      return "MediumImpact";
    case RiskType::LowImpact:
      return "LowImpact";
  }
  return "LowImpact";
}

}  // namespace ripple
