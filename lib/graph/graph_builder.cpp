// ripple/graph/graph_builder.cpp - Graph construction from a component snapshot
#include "ripple/graph/graph_builder.hpp"

namespace ripple
{

DependencyGraph GraphBuilder::build(gsl::span<const ComponentInfo> components)
{
  DependencyGraph graph;

  for (const auto & component : components) {
    graph.add_component(component.name);
  }

  for (const auto & component : components) {
    const ComponentIndex source = graph.add_component(component.name);
    for (const auto & dependency : component.dependencies) {
      const ComponentIndex target = graph.add_component(dependency);
      graph.add_edge(source, target);
    }
  }

  return graph;
}

}  // namespace ripple
