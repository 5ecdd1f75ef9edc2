// ripple/impact/impact_propagator.cpp - Impact diffusion implementation
#include "ripple/impact/impact_propagator.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace ripple
{

RankResult ImpactPropagator::compute_ranks(const DependencyGraph & graph) const
{
  RankResult result;

  const size_t n = graph.component_count();
  if (n == 0) {
    result.converged = true;
    return result;
  }

  const double d = options_.damping;
  std::vector<double> rank(n, 1.0 / static_cast<double>(n));
  std::vector<double> incoming(n, 0.0);

  for (uint32_t iteration = 0; iteration < options_.max_iterations; ++iteration) {
    std::fill(incoming.begin(), incoming.end(), 0.0);

    for (ComponentIndex u = 0; u < n; ++u) {
      const auto out_degree = static_cast<double>(graph.out_degree(u));
      if (out_degree == 0.0) {
        continue;
      }
      for (const auto & edge : graph.out_edges(u)) {
        incoming[edge.target] += rank[u] * edge.weight / out_degree;
      }
    }

    double total_diff = 0.0;
    for (size_t v = 0; v < n; ++v) {
      const double next = (1.0 - d) + d * incoming[v];
      total_diff += std::abs(next - rank[v]);
      rank[v] = next;
    }

    result.iterations = iteration + 1;
    if (total_diff < options_.tolerance) {
      result.converged = true;
      break;
    }
  }

  const double sum = std::accumulate(rank.begin(), rank.end(), 0.0);
  if (sum > 0.0) {
    for (auto & r : rank) {
      r /= sum;
    }
  }

  result.ranks = std::move(rank);
  return result;
}

ImpactScores ImpactPropagator::adjust(
  const DependencyGraph & graph, const RankResult & ranks, const ChangeSpecification & change) const
{
  ImpactScores scores;
  const double type_factor = type_multiplier(change.change_type);

  for (ComponentIndex v = 0; v < ranks.ranks.size(); ++v) {
    const std::string & name = graph.name_of(v);

    double adjusted = ranks.ranks[v] * type_factor;
    if (change.affects_contract(name)) {
      adjusted *= k_affected_contract_multiplier;
    }

    scores[name] = std::min(adjusted, 1.0);
  }

  return scores;
}

ImpactScores ImpactPropagator::propagate(
  const DependencyGraph & graph, const ChangeSpecification & change) const
{
  return adjust(graph, compute_ranks(graph), change);
}

double ImpactPropagator::type_multiplier(ChangeType type) noexcept
{
  switch (type) {
    case ChangeType::Contract:
      return k_contract_multiplier;
    case ChangeType::Implementation:
      return k_implementation_multiplier;
    case ChangeType::Resource:
      return k_resource_multiplier;
    case ChangeType::Other:
      return k_default_multiplier;
  }
  return k_default_multiplier;
}

}  // namespace ripple
