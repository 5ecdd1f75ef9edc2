// ripple/basic/yaml_source.hpp - yaml-cpp documents tied to the SourceRegistry
//
// Every YAML document ripple reads (change specifications, project config,
// component manifests, contracts) goes through these helpers so that node
// positions can be turned into SourceRanges for diagnostics.
//
#pragma once

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <optional>
#include <string>

#include "ripple/basic/diagnostic.hpp"
#include "ripple/basic/source_manager.hpp"

namespace ripple
{

struct YamlDocument
{
  FileId file_id = FileId::invalid();
  YAML::Node root;
};

/**
 * Read, register and parse a YAML file.
 *
 * Reports E0101 if the file is missing or unreadable and E0102 on a YAML
 * syntax error (positioned at the parser mark).
 */
[[nodiscard]] std::optional<YamlDocument> load_yaml_file(
  const std::filesystem::path & path, SourceRegistry & sources, DiagnosticBag & diags);

/**
 * Register in-memory content under a (possibly virtual) path and parse it.
 */
[[nodiscard]] std::optional<YamlDocument> parse_yaml(
  const std::filesystem::path & path, std::string content, SourceRegistry & sources,
  DiagnosticBag & diags);

/// Source range covered by a node; invalid for nodes without a mark
[[nodiscard]] SourceRange yaml_range(FileId file, const YAML::Node & node);

/// "path:line:column" for messages that cannot carry a SourceRange
[[nodiscard]] std::string yaml_location(const std::filesystem::path & path, const YAML::Node & node);

/// Numeric value of a scalar node, or nullopt if it is not a number
[[nodiscard]] std::optional<double> yaml_number(const YAML::Node & node);

}  // namespace ripple
