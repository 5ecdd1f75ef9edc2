// ripple/graph/dependency_graph.hpp - Directed, weighted component dependency graph
//
// Components live in an arena and are addressed by ComponentIndex; names map
// to indices through a separate lookup table. Outgoing edges are stored per
// source index. Parallel edges between the same pair are kept as-is.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ripple
{

using ComponentIndex = uint32_t;

struct ComponentRecord
{
  std::string name;
};

/**
 * Edge source -> target: "source depends on / is affected by target".
 */
struct DependencyEdge
{
  ComponentIndex source = 0;
  ComponentIndex target = 0;
  double weight = 1.0;
};

class DependencyGraph
{
public:
  DependencyGraph() = default;

  // ===========================================================================
  // Mutation
  // ===========================================================================

  /**
   * Add a component vertex.
   *
   * @return Index of the new vertex, or of the existing vertex with that name
   */
  ComponentIndex add_component(std::string_view name);

  /**
   * Add a directed edge, adding either endpoint as a vertex if missing.
   *
   * @throws std::invalid_argument if weight is not a positive finite number
   */
  void add_edge(std::string_view source, std::string_view target, double weight = 1.0);
  void add_edge(ComponentIndex source, ComponentIndex target, double weight = 1.0);

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] std::optional<ComponentIndex> find(std::string_view name) const;
  [[nodiscard]] bool contains(std::string_view name) const { return find(name).has_value(); }

  [[nodiscard]] const std::string & name_of(ComponentIndex index) const
  {
    return components_.at(index).name;
  }

  [[nodiscard]] gsl::span<const DependencyEdge> out_edges(ComponentIndex index) const
  {
    const auto & edges = outgoing_.at(index);
    return gsl::span<const DependencyEdge>(edges.data(), edges.size());
  }

  [[nodiscard]] size_t out_degree(ComponentIndex index) const { return outgoing_.at(index).size(); }

  [[nodiscard]] const std::vector<ComponentRecord> & components() const noexcept
  {
    return components_;
  }

  [[nodiscard]] size_t component_count() const noexcept { return components_.size(); }
  [[nodiscard]] size_t edge_count() const noexcept { return edge_count_; }
  [[nodiscard]] bool empty() const noexcept { return components_.empty(); }

private:
  std::vector<ComponentRecord> components_;
  std::vector<std::vector<DependencyEdge>> outgoing_;  // indexed by source
  std::unordered_map<std::string, ComponentIndex> index_by_name_;
  size_t edge_count_ = 0;
};

}  // namespace ripple
