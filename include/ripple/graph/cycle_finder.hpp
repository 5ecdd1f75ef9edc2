// ripple/graph/cycle_finder.hpp - Circular dependency detection
//
// Reports one cycle per back edge found by a depth-first walk that starts
// from every vertex in index order. Self-dependencies are reported as
// one-element cycles.
//
#pragma once

#include <string>
#include <vector>

#include "ripple/graph/dependency_graph.hpp"

namespace ripple
{

struct DependencyCycle
{
  /// Components on the cycle, starting at the component the back edge reaches
  std::vector<ComponentIndex> path;

  /// "A -> B -> A"
  [[nodiscard]] std::string describe(const DependencyGraph & graph) const;
};

class CycleFinder
{
public:
  [[nodiscard]] static std::vector<DependencyCycle> find_cycles(const DependencyGraph & graph);
};

}  // namespace ripple
