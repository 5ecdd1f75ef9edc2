// ripple/graph/cycle_finder.cpp - Circular dependency detection
#include "ripple/graph/cycle_finder.hpp"

#include <cstdint>
#include <functional>

namespace ripple
{

namespace
{

enum class Color : uint8_t { White, Gray, Black };

DependencyCycle cycle_from_stack(
  gsl::span<const ComponentIndex> stack, ComponentIndex back_edge_target)
{
  DependencyCycle cycle;

  size_t start = 0;
  for (; start < stack.size(); ++start) {
    if (stack[start] == back_edge_target) {
      break;
    }
  }

  for (size_t i = start; i < stack.size(); ++i) {
    cycle.path.push_back(stack[i]);
  }
  return cycle;
}

}  // namespace

std::string DependencyCycle::describe(const DependencyGraph & graph) const
{
  std::string msg;
  for (size_t i = 0; i < path.size(); ++i) {
    if (i > 0) msg += " -> ";
    msg += graph.name_of(path[i]);
  }
  if (!path.empty()) {
    msg += " -> ";
    msg += graph.name_of(path.front());
  }
  return msg;
}

std::vector<DependencyCycle> CycleFinder::find_cycles(const DependencyGraph & graph)
{
  std::vector<DependencyCycle> cycles;
  std::vector<Color> color(graph.component_count(), Color::White);

  std::vector<ComponentIndex> stack;
  stack.reserve(64);

  std::function<void(ComponentIndex)> dfs;
  dfs = [&](ComponentIndex u) {
    color[u] = Color::Gray;
    stack.push_back(u);

    for (const auto & edge : graph.out_edges(u)) {
      const Color c = color[edge.target];
      if (c == Color::Gray) {
        const gsl::span<const ComponentIndex> stack_view(stack.data(), stack.size());
        cycles.push_back(cycle_from_stack(stack_view, edge.target));
        continue;
      }
      if (c == Color::White) {
        dfs(edge.target);
      }
    }

    stack.pop_back();
    color[u] = Color::Black;
  };

  for (ComponentIndex v = 0; v < graph.component_count(); ++v) {
    if (color[v] == Color::White) {
      dfs(v);
    }
  }

  return cycles;
}

}  // namespace ripple
