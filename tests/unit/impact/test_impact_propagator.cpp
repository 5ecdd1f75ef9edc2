// tests/unit/impact/test_impact_propagator.cpp - Impact diffusion and score adjustment

#include <gtest/gtest.h>

#include <numeric>
#include <string>
#include <utility>
#include <vector>

#include "ripple/graph/graph_builder.hpp"
#include "ripple/impact/impact_propagator.hpp"

using namespace ripple;

namespace
{

ChangeSpecification make_change(
  const std::string & component, ChangeType type, std::vector<std::string> contracts = {})
{
  ChangeSpecification spec;
  spec.component = component;
  spec.change_type = type;
  spec.change_type_text = std::string(to_string(type));
  spec.affected_contracts = std::move(contracts);
  return spec;
}

DependencyGraph build(const std::vector<ComponentInfo> & components)
{
  return GraphBuilder::build(components);
}

}  // namespace

// ============================================================================
// Ranks
// ============================================================================

TEST(ImpactPropagator, EmptyGraphYieldsNothing)
{
  const DependencyGraph graph;
  const ImpactPropagator propagator;

  const RankResult ranks = propagator.compute_ranks(graph);
  EXPECT_TRUE(ranks.ranks.empty());
  EXPECT_EQ(ranks.iterations, 0U);

  const ImpactScores scores = propagator.propagate(graph, make_change("X", ChangeType::Contract));
  EXPECT_TRUE(scores.empty());
}

TEST(ImpactPropagator, NormalizedRanksSumToOne)
{
  const DependencyGraph graph = build({
    {"Gateway", {"Orders", "Users", "Auth"}},
    {"Orders", {"Inventory", "Payments", "Users"}},
    {"Payments", {"Ledger", "Auth"}},
    {"Users", {"Auth"}},
    {"Auth", {"Users"}},
    {"Inventory", {}},
    {"Reporting", {"Ledger", "Orders", "Orders"}},
  });

  const RankResult ranks = ImpactPropagator().compute_ranks(graph);

  ASSERT_EQ(ranks.ranks.size(), graph.component_count());
  const double sum = std::accumulate(ranks.ranks.begin(), ranks.ranks.end(), 0.0);
  EXPECT_NEAR(sum, 1.0, 1e-6);
  for (const double r : ranks.ranks) {
    EXPECT_GT(r, 0.0);
  }
}

TEST(ImpactPropagator, DependencyCollectsMoreRank)
{
  // A depends on B: B receives A's rank along the edge
  const DependencyGraph graph = build({{"A", {"B"}}, {"B", {}}});

  const RankResult ranks = ImpactPropagator().compute_ranks(graph);

  ASSERT_EQ(ranks.ranks.size(), 2U);
  // Fixed point: A = 0.15, B = 0.15 + 0.85 * 0.15 = 0.2775
  EXPECT_NEAR(ranks.ranks[0], 0.15 / 0.4275, 1e-9);
  EXPECT_NEAR(ranks.ranks[1], 0.2775 / 0.4275, 1e-9);
  EXPECT_TRUE(ranks.converged);
  EXPECT_EQ(ranks.iterations, 3U);
}

TEST(ImpactPropagator, IterationCapStopsDiffusion)
{
  PropagationOptions options;
  options.max_iterations = 1;

  const DependencyGraph graph = build({{"A", {"B"}}, {"B", {}}});
  const RankResult ranks = ImpactPropagator(options).compute_ranks(graph);

  EXPECT_EQ(ranks.iterations, 1U);
  EXPECT_FALSE(ranks.converged);
  EXPECT_NEAR(ranks.ranks[0] + ranks.ranks[1], 1.0, 1e-9);
}

TEST(ImpactPropagator, CyclesTerminate)
{
  const DependencyGraph graph = build({{"A", {"B"}}, {"B", {"C"}}, {"C", {"A"}}});

  const RankResult ranks = ImpactPropagator().compute_ranks(graph);

  EXPECT_LE(ranks.iterations, 100U);
  for (const double r : ranks.ranks) {
    EXPECT_NEAR(r, 1.0 / 3.0, 1e-9);
  }
}

// ============================================================================
// Adjustment
// ============================================================================

TEST(ImpactPropagator, TypeMultipliers)
{
  EXPECT_DOUBLE_EQ(ImpactPropagator::type_multiplier(ChangeType::Contract), 1.5);
  EXPECT_DOUBLE_EQ(ImpactPropagator::type_multiplier(ChangeType::Implementation), 1.2);
  EXPECT_DOUBLE_EQ(ImpactPropagator::type_multiplier(ChangeType::Resource), 1.3);
  EXPECT_DOUBLE_EQ(ImpactPropagator::type_multiplier(ChangeType::Other), 1.0);
}

TEST(ImpactPropagator, SingleIsolatedComponentIsCapped)
{
  const DependencyGraph graph = build({{"X", {}}});

  const ImpactScores scores =
    ImpactPropagator().propagate(graph, make_change("X", ChangeType::Implementation));

  ASSERT_EQ(scores.size(), 1U);
  EXPECT_DOUBLE_EQ(scores.at("X"), 1.0);
}

TEST(ImpactPropagator, DisconnectedComponentsShareRank)
{
  const DependencyGraph graph = build({{"A", {}}, {"B", {}}});

  const ImpactScores scores =
    ImpactPropagator().propagate(graph, make_change("A", ChangeType::Resource));

  EXPECT_NEAR(scores.at("A"), 0.65, 1e-9);
  EXPECT_NEAR(scores.at("B"), 0.65, 1e-9);
}

TEST(ImpactPropagator, ContractMatchMultipliesFurther)
{
  const DependencyGraph graph = build({{"PayAPI", {}}});

  const ImpactScores scores =
    ImpactPropagator().propagate(graph, make_change("PayAPI", ChangeType::Contract, {"PayAPI"}));

  // 1.0 * 1.5 * 1.4 = 2.1, capped
  EXPECT_DOUBLE_EQ(scores.at("PayAPI"), 1.0);
}

TEST(ImpactPropagator, ContractMultiplierOnlyForNamedComponents)
{
  const DependencyGraph graph = build({{"A", {}}, {"B", {}}, {"C", {}}, {"D", {}}});

  const ImpactScores scores =
    ImpactPropagator().propagate(graph, make_change("A", ChangeType::Other, {"B"}));

  EXPECT_NEAR(scores.at("A"), 0.25, 1e-9);
  EXPECT_NEAR(scores.at("B"), 0.25 * 1.4, 1e-9);
  EXPECT_NEAR(scores.at("C"), 0.25, 1e-9);
}

TEST(ImpactPropagator, TypeScalesEveryComponent)
{
  const DependencyGraph graph = build({{"A", {}}, {"B", {}}, {"C", {}}, {"D", {}}});

  const ImpactScores scores =
    ImpactPropagator().propagate(graph, make_change("A", ChangeType::Contract));

  for (const auto & [name, score] : scores) {
    EXPECT_NEAR(score, 0.25 * 1.5, 1e-9) << name;
  }
}

TEST(ImpactPropagator, ScoresAreBounded)
{
  const DependencyGraph graph = build({
    {"Hub", {"A", "B", "C"}},
    {"A", {"Core"}},
    {"B", {"Core"}},
    {"C", {"Core"}},
    {"Core", {}},
  });

  const ImpactScores scores = ImpactPropagator().propagate(
    graph, make_change("Core", ChangeType::Contract, {"Core", "Hub", "A"}));

  ASSERT_EQ(scores.size(), 5U);
  for (const auto & [name, score] : scores) {
    EXPECT_GE(score, 0.0) << name;
    EXPECT_LE(score, 1.0) << name;
  }
}

TEST(ImpactPropagator, ScoresAreOrderedByName)
{
  const DependencyGraph graph = build({{"Zeta", {}}, {"Alpha", {"Zeta"}}, {"Mid", {}}});

  const ImpactScores scores =
    ImpactPropagator().propagate(graph, make_change("Zeta", ChangeType::Other));

  std::vector<std::string> names;
  for (const auto & entry : scores) {
    names.push_back(entry.first);
  }
  EXPECT_EQ(names, (std::vector<std::string>{"Alpha", "Mid", "Zeta"}));
}
