// tests/unit/project/test_change_spec_loader.cpp - Change specification documents

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "ripple/project/change_spec_loader.hpp"

using namespace ripple;

namespace
{

struct Loaded
{
  std::optional<ChangeSpecification> spec;
  DiagnosticBag diags;
};

Loaded load(const std::string & text)
{
  SourceRegistry sources;
  Loaded out;
  out.spec = parse_change_specification("/tmp/ripple_change.yaml", text, sources, out.diags);
  return out;
}

bool has_message(const DiagnosticBag & diags, const std::string & needle)
{
  for (const auto & d : diags) {
    if (d.message.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace

TEST(ChangeSpecLoader, LoadsFullDocument)
{
  const Loaded loaded = load(
    "component: PaymentGateway\n"
    "changeType: contract\n"
    "changes:\n"
    "  method: charge\n"
    "  params: [amount, currency]\n"
    "affectedContracts: [PayAPI, Billing]\n"
    "expectedImpact:\n"
    "  PaymentGateway: 0.8\n"
    "  Checkout: 1\n");

  ASSERT_TRUE(loaded.spec.has_value());
  EXPECT_TRUE(loaded.diags.empty());

  const ChangeSpecification & spec = *loaded.spec;
  EXPECT_EQ(spec.component, "PaymentGateway");
  EXPECT_EQ(spec.change_type, ChangeType::Contract);
  EXPECT_EQ(spec.change_type_text, "contract");
  EXPECT_EQ(spec.changes.at("method"), "charge");
  EXPECT_EQ(spec.changes.at("params"), "[amount, currency]");
  EXPECT_EQ(spec.affected_contracts, (std::vector<std::string>{"PayAPI", "Billing"}));
  EXPECT_DOUBLE_EQ(spec.expected_impact.at("PaymentGateway"), 0.8);
  EXPECT_DOUBLE_EQ(spec.expected_impact.at("Checkout"), 1.0);
}

TEST(ChangeSpecLoader, OptionalSectionsDefaultEmpty)
{
  const Loaded loaded = load("component: A\nchangeType: Implementation\n");

  ASSERT_TRUE(loaded.spec.has_value());
  EXPECT_EQ(loaded.spec->change_type, ChangeType::Implementation);
  EXPECT_TRUE(loaded.spec->changes.empty());
  EXPECT_TRUE(loaded.spec->affected_contracts.empty());
  EXPECT_TRUE(loaded.spec->expected_impact.empty());
}

TEST(ChangeSpecLoader, UnknownChangeTypeWarnsAndLoadsAsOther)
{
  const Loaded loaded = load("component: A\nchangeType: refactor\n");

  ASSERT_TRUE(loaded.spec.has_value());
  EXPECT_EQ(loaded.spec->change_type, ChangeType::Other);
  EXPECT_EQ(loaded.spec->change_type_text, "refactor");
  EXPECT_FALSE(loaded.diags.has_errors());
  ASSERT_EQ(loaded.diags.size(), 1U);
  const Diagnostic & d = loaded.diags.all().front();
  EXPECT_EQ(d.severity, Severity::Warning);
  EXPECT_EQ(d.code, diag_code::k_unknown_change_type);
  EXPECT_EQ(d.message, "unrecognized changeType 'refactor'");

  // Primary label on the value, related context on the component
  ASSERT_EQ(d.labels.size(), 2U);
  EXPECT_EQ(d.primary_range().get_begin().offset(), 25U);
  EXPECT_EQ(d.primary_range().size(), 8U);
  EXPECT_EQ(d.labels[1].style, LabelStyle::Secondary);
  EXPECT_EQ(d.labels[1].range.get_begin().offset(), 11U);
  EXPECT_EQ(d.labels[1].message, "impact of this component is not scaled");
}

TEST(ChangeSpecLoader, UnknownChangeTypeWithoutComponentHasSingleLabel)
{
  const Loaded loaded = load("changeType: refactor\n");

  EXPECT_FALSE(loaded.spec.has_value());
  bool saw_warning = false;
  for (const auto & d : loaded.diags) {
    if (d.code == diag_code::k_unknown_change_type) {
      saw_warning = true;
      EXPECT_EQ(d.labels.size(), 1U);
    }
  }
  EXPECT_TRUE(saw_warning);
}

TEST(ChangeSpecLoader, MissingRequiredFields)
{
  const Loaded loaded = load("changes:\n  a: b\n");

  EXPECT_FALSE(loaded.spec.has_value());
  EXPECT_TRUE(loaded.diags.has_code(diag_code::k_input_malformed));
  EXPECT_TRUE(has_message(loaded.diags, "missing required field 'component'"));
  EXPECT_TRUE(has_message(loaded.diags, "missing required field 'changeType'"));
}

TEST(ChangeSpecLoader, RootMustBeMap)
{
  const Loaded loaded = load("- component: A\n");

  EXPECT_FALSE(loaded.spec.has_value());
  ASSERT_EQ(loaded.diags.size(), 1U);
  EXPECT_EQ(loaded.diags.all().front().message, "change specification must be a map");
}

TEST(ChangeSpecLoader, FieldsMustBeNonEmptyStrings)
{
  const Loaded loaded = load("component: [A]\nchangeType: ''\n");

  EXPECT_FALSE(loaded.spec.has_value());
  EXPECT_TRUE(has_message(loaded.diags, "'component' must be a non-empty string"));
  EXPECT_TRUE(has_message(loaded.diags, "'changeType' must be a non-empty string"));
}

TEST(ChangeSpecLoader, SectionShapes)
{
  EXPECT_TRUE(has_message(
    load("component: A\nchangeType: other\nchanges: [x]\n").diags, "'changes' must be a map"));
  EXPECT_TRUE(has_message(
    load("component: A\nchangeType: other\naffectedContracts: PayAPI\n").diags,
    "'affectedContracts' must be a list of contract names"));
  EXPECT_TRUE(has_message(
    load("component: A\nchangeType: other\naffectedContracts: [{a: b}]\n").diags,
    "contract names must be non-empty strings"));
  EXPECT_TRUE(has_message(
    load("component: A\nchangeType: other\nexpectedImpact: [0.5]\n").diags,
    "'expectedImpact' must be a map of component to score"));
}

TEST(ChangeSpecLoader, ExpectedImpactMustBeNumeric)
{
  const Loaded loaded = load(
    "component: A\n"
    "changeType: other\n"
    "expectedImpact:\n"
    "  B: high\n"
    "  C: .nan\n");

  EXPECT_FALSE(loaded.spec.has_value());
  EXPECT_TRUE(has_message(loaded.diags, "expected impact for 'B' must be a number"));
  EXPECT_TRUE(has_message(loaded.diags, "expected impact for 'C' must be a number"));
}

TEST(ChangeSpecLoader, DiagnosticsArePositioned)
{
  const Loaded loaded = load("component: A\nchangeType: other\nchanges: 3\n");

  ASSERT_EQ(loaded.diags.size(), 1U);
  EXPECT_TRUE(loaded.diags.all().front().primary_range().is_valid());
}

TEST(ChangeSpecLoader, MissingFileIsUnreadable)
{
  SourceRegistry sources;
  DiagnosticBag diags;

  const auto spec =
    load_change_specification("/nonexistent/ripple/change.yaml", sources, diags);

  EXPECT_FALSE(spec.has_value());
  EXPECT_TRUE(diags.has_code(diag_code::k_input_unreadable));
}
