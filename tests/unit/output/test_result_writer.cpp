// tests/unit/output/test_result_writer.cpp - Result serialization

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "ripple/output/result_writer.hpp"

using namespace ripple;

namespace
{

ImpactAnalysisResult sample_result()
{
  ImpactAnalysisResult result;
  result.impact_scores = {{"Checkout", 0.65}, {"PayAPI", 1.0}, {"Search", 0.2}};

  RiskArea area;
  area.component = "PayAPI";
  area.risk_type = RiskType::ContractCompliance;
  area.risk_score = 1.0;
  area.description = "High risk of breaking changes affecting PayAPI";
  area.affected_contracts = {"PayAPI"};
  result.risk_areas.push_back(area);

  result.suggested_mitigations = {
    "Implement compatibility layer for PayAPI", "Add contract validation tests for PayAPI"};

  result.affected_components.high = {"PayAPI"};
  result.affected_components.medium = {"Checkout"};
  result.affected_components.low = {"Search"};
  result.affected_components.contracts = std::vector<std::string>{"PayAPI"};
  return result;
}

}  // namespace

TEST(OutputFormat, Parse)
{
  EXPECT_EQ(parse_output_format("yaml"), OutputFormat::Yaml);
  EXPECT_EQ(parse_output_format("json"), OutputFormat::Json);
  EXPECT_FALSE(parse_output_format("xml").has_value());
  EXPECT_STREQ(to_string(OutputFormat::Json), "json");
}

TEST(ResultWriter, YamlCarriesAllSections)
{
  const YAML::Node doc = YAML::Load(write_result_yaml(sample_result()));

  ASSERT_TRUE(doc.IsMap());
  EXPECT_DOUBLE_EQ(doc["impactScores"]["Checkout"].as<double>(), 0.65);
  EXPECT_DOUBLE_EQ(doc["impactScores"]["PayAPI"].as<double>(), 1.0);

  const YAML::Node area = doc["riskAreas"][0];
  EXPECT_EQ(area["component"].as<std::string>(), "PayAPI");
  EXPECT_EQ(area["riskType"].as<std::string>(), "ContractCompliance");
  EXPECT_DOUBLE_EQ(area["riskScore"].as<double>(), 1.0);
  EXPECT_EQ(area["affectedContracts"][0].as<std::string>(), "PayAPI");

  EXPECT_EQ(doc["suggestedMitigations"].size(), 2U);
  EXPECT_EQ(doc["affectedComponents"]["medium"][0].as<std::string>(), "Checkout");
  EXPECT_EQ(doc["affectedComponents"]["contracts"][0].as<std::string>(), "PayAPI");
}

TEST(ResultWriter, YamlOmitsContractsTierWhenAbsent)
{
  ImpactAnalysisResult result = sample_result();
  result.affected_components.contracts.reset();

  const YAML::Node doc = YAML::Load(write_result_yaml(result));
  EXPECT_FALSE(doc["affectedComponents"]["contracts"].IsDefined());
}

TEST(ResultWriter, JsonCarriesAllSections)
{
  const auto doc = nlohmann::json::parse(write_result_json(sample_result()));

  EXPECT_DOUBLE_EQ(doc["impactScores"]["Checkout"].get<double>(), 0.65);
  EXPECT_EQ(doc["riskAreas"].size(), 1U);
  EXPECT_EQ(doc["riskAreas"][0]["riskType"], "ContractCompliance");
  EXPECT_EQ(doc["suggestedMitigations"][1], "Add contract validation tests for PayAPI");
  EXPECT_EQ(doc["affectedComponents"]["high"], nlohmann::json::array({"PayAPI"}));
  EXPECT_TRUE(doc["affectedComponents"].contains("contracts"));
}

TEST(ResultWriter, EmptyResultHasEmptyCollections)
{
  const ImpactAnalysisResult result;

  const auto json = nlohmann::json::parse(write_result_json(result));
  EXPECT_TRUE(json["impactScores"].is_object());
  EXPECT_TRUE(json["impactScores"].empty());
  EXPECT_TRUE(json["riskAreas"].is_array());
  EXPECT_FALSE(json["affectedComponents"].contains("contracts"));

  const YAML::Node yaml = YAML::Load(write_result_yaml(result));
  EXPECT_EQ(yaml["riskAreas"].size(), 0U);
  EXPECT_TRUE(yaml["affectedComponents"]["high"].IsSequence());
}

TEST(ResultWriter, OutputIsDeterministic)
{
  const ImpactAnalysisResult result = sample_result();

  EXPECT_EQ(write_result(result, OutputFormat::Yaml), write_result(result, OutputFormat::Yaml));
  EXPECT_EQ(write_result(result, OutputFormat::Json), write_result(result, OutputFormat::Json));
}

TEST(ResultWriter, ScoresAreNameOrdered)
{
  const ImpactScores scores = {{"B", 1.0}, {"A", 0.65}};

  EXPECT_EQ(write_scores(scores, OutputFormat::Yaml), "A: 0.65\nB: 1\n");

  const auto json = nlohmann::json::parse(write_scores(scores, OutputFormat::Json));
  EXPECT_EQ(json.begin().key(), "A");
}
