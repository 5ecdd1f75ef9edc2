// tests/unit/impact/test_change_spec.cpp - Change type mapping

#include <gtest/gtest.h>

#include "ripple/impact/change_spec.hpp"
#include "ripple/impact/impact_result.hpp"

using namespace ripple;

TEST(ChangeType, ParsesCaseInsensitively)
{
  EXPECT_EQ(parse_change_type("contract"), ChangeType::Contract);
  EXPECT_EQ(parse_change_type("Implementation"), ChangeType::Implementation);
  EXPECT_EQ(parse_change_type("RESOURCE"), ChangeType::Resource);
  EXPECT_EQ(parse_change_type("other"), ChangeType::Other);
}

TEST(ChangeType, UnknownMapsToOther)
{
  EXPECT_EQ(parse_change_type("refactor"), ChangeType::Other);
  EXPECT_EQ(parse_change_type(""), ChangeType::Other);

  EXPECT_FALSE(is_known_change_type("refactor"));
  EXPECT_TRUE(is_known_change_type("Other"));
  EXPECT_TRUE(is_known_change_type("contract"));
}

TEST(ChangeType, ToString)
{
  EXPECT_EQ(to_string(ChangeType::Contract), "contract");
  EXPECT_EQ(to_string(ChangeType::Implementation), "implementation");
  EXPECT_EQ(to_string(ChangeType::Resource), "resource");
  EXPECT_EQ(to_string(ChangeType::Other), "other");
}

TEST(ChangeSpecification, AffectsContractIsExactMatch)
{
  ChangeSpecification spec;
  spec.affected_contracts = {"PayAPI", "Billing"};

  EXPECT_TRUE(spec.affects_contract("PayAPI"));
  EXPECT_TRUE(spec.affects_contract("Billing"));
  EXPECT_FALSE(spec.affects_contract("Pay"));
  EXPECT_FALSE(spec.affects_contract("payapi"));
}

TEST(RiskType, ToString)
{
  EXPECT_EQ(to_string(RiskType::ContractCompliance), "ContractCompliance");
  EXPECT_EQ(to_string(RiskType::HighImpact), "HighImpact");
  EXPECT_EQ(to_string(RiskType::MediumImpact), "MediumImpact");
  EXPECT_EQ(to_string(RiskType::LowImpact), "LowImpact");
}
