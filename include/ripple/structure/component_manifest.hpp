// ripple/structure/component_manifest.hpp - Component topology from a YAML manifest
//
// Manifest format:
//
//   components:
//     - name: Checkout
//       dependencies: [PaymentGateway, Inventory]
//     - name: PaymentGateway
//
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "ripple/structure/code_structure_provider.hpp"

namespace ripple
{

class ComponentManifestProvider : public CodeStructureProvider
{
public:
  explicit ComponentManifestProvider(std::filesystem::path manifest_path)
  : manifest_path_(std::move(manifest_path))
  {
  }

  /**
   * Read the manifest.
   *
   * @throws CollaboratorError if the manifest is missing, is not valid YAML,
   *         or has an entry without a name or with non-list dependencies
   */
  [[nodiscard]] std::vector<ComponentInfo> list_components() override;

  /**
   * Parse manifest text. Exposed for callers that hold the content already.
   *
   * @param origin Path used in error messages
   */
  [[nodiscard]] static std::vector<ComponentInfo> parse(
    const std::string & content, const std::filesystem::path & origin);

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return manifest_path_; }

private:
  std::filesystem::path manifest_path_;
};

/**
 * Default name of the component manifest next to ripple.yaml.
 */
inline constexpr const char * k_component_manifest_file_name = "components.yaml";

}  // namespace ripple
