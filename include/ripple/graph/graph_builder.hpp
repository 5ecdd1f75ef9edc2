// ripple/graph/graph_builder.hpp - Builds a DependencyGraph from a component snapshot
#pragma once

#include <gsl/span>
#include <string>
#include <vector>

#include "ripple/graph/dependency_graph.hpp"

namespace ripple
{

/**
 * One component as reported by a code structure provider.
 */
struct ComponentInfo
{
  std::string name;
  std::vector<std::string> dependencies;
};

class GraphBuilder
{
public:
  /**
   * Build the dependency graph for a component snapshot.
   *
   * Every component becomes a vertex (in snapshot order), then every listed
   * dependency adds an edge component -> dependency with weight 1.0. A
   * dependency that is not itself a listed component becomes a sink vertex.
   * An empty snapshot yields an empty graph.
   */
  [[nodiscard]] static DependencyGraph build(gsl::span<const ComponentInfo> components);
};

}  // namespace ripple
