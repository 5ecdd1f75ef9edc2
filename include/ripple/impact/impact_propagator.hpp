// ripple/impact/impact_propagator.hpp - Iterative impact diffusion over the dependency graph
//
// A PageRank-style diffusion computes a relative rank per component; the
// change's type and touched contracts then scale every rank into a final
// score capped at 1.0.
//
#pragma once

#include <cstdint>
#include <vector>

#include "ripple/graph/dependency_graph.hpp"
#include "ripple/impact/change_spec.hpp"
#include "ripple/impact/impact_result.hpp"

namespace ripple
{

struct PropagationOptions
{
  /// Share of rank carried along edges each iteration
  double damping = 0.85;

  /// Hard iteration cap; the diffusion always terminates
  uint32_t max_iterations = 100;

  /// Stop once the summed absolute rank change drops below this
  double tolerance = 1e-4;
};

/**
 * Normalized ranks, indexed by ComponentIndex.
 */
struct RankResult
{
  std::vector<double> ranks;
  uint32_t iterations = 0;
  bool converged = false;
};

class ImpactPropagator
{
public:
  static constexpr double k_contract_multiplier = 1.5;
  static constexpr double k_implementation_multiplier = 1.2;
  static constexpr double k_resource_multiplier = 1.3;
  static constexpr double k_default_multiplier = 1.0;

  /// Extra factor for a component named in the change's affected contracts
  static constexpr double k_affected_contract_multiplier = 1.4;

  explicit ImpactPropagator(PropagationOptions options = {}) : options_(options) {}

  /**
   * Run the diffusion and normalize so the ranks sum to 1.
   *
   * Every vertex starts at 1/N. Each iteration computes, synchronously,
   *   rank'(v) = (1 - d) + d * sum over edges u->v of rank(u) * w / outDegree(u)
   * Rank held by vertices without outgoing edges is not redistributed.
   * An empty graph yields an empty result.
   */
  [[nodiscard]] RankResult compute_ranks(const DependencyGraph & graph) const;

  /**
   * Scale normalized ranks by the change's character and cap at 1.0.
   */
  [[nodiscard]] ImpactScores adjust(
    const DependencyGraph & graph, const RankResult & ranks,
    const ChangeSpecification & change) const;

  /// compute_ranks followed by adjust
  [[nodiscard]] ImpactScores propagate(
    const DependencyGraph & graph, const ChangeSpecification & change) const;

  [[nodiscard]] static double type_multiplier(ChangeType type) noexcept;

  [[nodiscard]] const PropagationOptions & options() const noexcept { return options_; }

private:
  PropagationOptions options_;
};

}  // namespace ripple
