// ripple/project/change_spec_loader.hpp - Change specification documents
//
// Document format:
//
//   component: PaymentGateway
//   changeType: contract          # contract | implementation | resource | other
//   changes:
//     method: charge
//     signature: "charge(amount, currency)"
//   affectedContracts: [PayAPI]
//   expectedImpact:
//     PaymentGateway: 0.8
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "ripple/basic/diagnostic.hpp"
#include "ripple/basic/source_manager.hpp"
#include "ripple/impact/change_spec.hpp"

namespace ripple
{

/**
 * Load and validate a change specification file.
 *
 * Reports E0101 when the file cannot be read, E0102 when it is not valid
 * YAML or has the wrong shape, and W0402 for an unrecognized changeType
 * (the change is still loaded, as ChangeType::Other).
 *
 * @return The specification, or nullopt if any error was reported
 */
[[nodiscard]] std::optional<ChangeSpecification> load_change_specification(
  const std::filesystem::path & path, SourceRegistry & sources, DiagnosticBag & diags);

/**
 * Same as load_change_specification, for content already in memory.
 *
 * @param path Name the content is registered under (used in diagnostics)
 */
[[nodiscard]] std::optional<ChangeSpecification> parse_change_specification(
  const std::filesystem::path & path, std::string content, SourceRegistry & sources,
  DiagnosticBag & diags);

}  // namespace ripple
