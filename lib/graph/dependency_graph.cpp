// ripple/graph/dependency_graph.cpp - Dependency graph implementation
#include "ripple/graph/dependency_graph.hpp"

#include <cmath>
#include <stdexcept>

namespace ripple
{

ComponentIndex DependencyGraph::add_component(std::string_view name)
{
  std::string key(name);
  if (const auto it = index_by_name_.find(key); it != index_by_name_.end()) {
    return it->second;
  }

  const auto index = static_cast<ComponentIndex>(components_.size());
  components_.push_back(ComponentRecord{key});
  outgoing_.emplace_back();
  index_by_name_.emplace(std::move(key), index);
  return index;
}

void DependencyGraph::add_edge(std::string_view source, std::string_view target, double weight)
{
  const ComponentIndex s = add_component(source);
  const ComponentIndex t = add_component(target);
  add_edge(s, t, weight);
}

void DependencyGraph::add_edge(ComponentIndex source, ComponentIndex target, double weight)
{
  if (!(weight > 0.0) || !std::isfinite(weight)) {
    throw std::invalid_argument("dependency edge weight must be a positive number");
  }
  if (source >= components_.size() || target >= components_.size()) {
    throw std::out_of_range("dependency edge endpoint is not a component of this graph");
  }

  outgoing_[source].push_back(DependencyEdge{source, target, weight});
  ++edge_count_;
}

std::optional<ComponentIndex> DependencyGraph::find(std::string_view name) const
{
  if (const auto it = index_by_name_.find(std::string(name)); it != index_by_name_.end()) {
    return it->second;
  }
  return std::nullopt;
}

}  // namespace ripple
