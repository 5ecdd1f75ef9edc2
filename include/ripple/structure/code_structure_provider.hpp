// ripple/structure/code_structure_provider.hpp - Source of component topology
#pragma once

#include <utility>
#include <vector>

#include "ripple/graph/graph_builder.hpp"

namespace ripple
{

/**
 * Supplies the components of the analysed system and what each depends on.
 *
 * Implementations report failure by throwing CollaboratorError.
 */
class CodeStructureProvider
{
public:
  virtual ~CodeStructureProvider() = default;

  /// Current snapshot of all components, in a stable order
  [[nodiscard]] virtual std::vector<ComponentInfo> list_components() = 0;
};

/**
 * Provider over a fixed component list.
 */
class InMemoryStructureProvider : public CodeStructureProvider
{
public:
  InMemoryStructureProvider() = default;
  explicit InMemoryStructureProvider(std::vector<ComponentInfo> components)
  : components_(std::move(components))
  {
  }

  [[nodiscard]] std::vector<ComponentInfo> list_components() override { return components_; }

  void set_components(std::vector<ComponentInfo> components)
  {
    components_ = std::move(components);
  }

private:
  std::vector<ComponentInfo> components_;
};

}  // namespace ripple
