// ripple/project/change_spec_loader.cpp - Change specification documents
#include "ripple/project/change_spec_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>

#include "ripple/basic/yaml_source.hpp"

namespace ripple
{

namespace
{

class ChangeSpecReader
{
public:
  ChangeSpecReader(FileId file, DiagnosticBag & diags) : file_(file), diags_(diags) {}

  std::optional<ChangeSpecification> read(const YAML::Node & root)
  {
    if (!root.IsMap()) {
      malformed(root, "change specification must be a map", "expected 'component' and 'changeType'");
      return std::nullopt;
    }

    ChangeSpecification spec;

    if (auto component = required_string(root, "component")) {
      spec.component = std::move(*component);
    }
    if (auto change_type = required_string(root, "changeType")) {
      spec.change_type_text = std::move(*change_type);
      spec.change_type = parse_change_type(spec.change_type_text);
      if (!is_known_change_type(spec.change_type_text)) {
        auto warning = diags_.report_warning(
          yaml_range(file_, root["changeType"]),
          "unrecognized changeType '" + spec.change_type_text + "'", "treated as 'other'");
        warning.with_code(diag_code::k_unknown_change_type)
          .with_help("expected one of: contract, implementation, resource, other");
        if (!spec.component.empty()) {
          warning.with_secondary_label(
            yaml_range(file_, root["component"]), "impact of this component is not scaled");
        }
      }
    }

    read_changes(root["changes"], spec);
    read_affected_contracts(root["affectedContracts"], spec);
    read_expected_impact(root["expectedImpact"], spec);

    if (failed_) {
      return std::nullopt;
    }
    return spec;
  }

private:
  void malformed(const YAML::Node & node, std::string message, std::string label = "")
  {
    failed_ = true;
    diags_.report_error(yaml_range(file_, node), std::move(message), std::move(label))
      .with_code(diag_code::k_input_malformed);
  }

  std::optional<std::string> required_string(const YAML::Node & root, const char * key)
  {
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) {
      failed_ = true;
      diags_
        .report_error(
          yaml_range(file_, root), std::string("missing required field '") + key + "'")
        .with_code(diag_code::k_input_malformed);
      return std::nullopt;
    }
    if (!node.IsScalar() || node.Scalar().empty()) {
      malformed(node, std::string("'") + key + "' must be a non-empty string");
      return std::nullopt;
    }
    return node.Scalar();
  }

  static std::string render(const YAML::Node & node)
  {
    if (node.IsScalar()) {
      return node.Scalar();
    }
    if (node.IsNull()) {
      return "";
    }
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out << node;
    return out.c_str();
  }

  void read_changes(const YAML::Node & node, ChangeSpecification & spec)
  {
    if (!node || node.IsNull()) {
      return;
    }
    if (!node.IsMap()) {
      malformed(node, "'changes' must be a map");
      return;
    }
    for (const auto & entry : node) {
      if (!entry.first.IsScalar()) {
        malformed(entry.first, "'changes' keys must be strings");
        continue;
      }
      spec.changes[entry.first.Scalar()] = render(entry.second);
    }
  }

  void read_affected_contracts(const YAML::Node & node, ChangeSpecification & spec)
  {
    if (!node || node.IsNull()) {
      return;
    }
    if (!node.IsSequence()) {
      malformed(node, "'affectedContracts' must be a list of contract names");
      return;
    }
    for (const auto & item : node) {
      if (!item.IsScalar() || item.Scalar().empty()) {
        malformed(item, "contract names must be non-empty strings");
        continue;
      }
      spec.affected_contracts.push_back(item.Scalar());
    }
  }

  void read_expected_impact(const YAML::Node & node, ChangeSpecification & spec)
  {
    if (!node || node.IsNull()) {
      return;
    }
    if (!node.IsMap()) {
      malformed(node, "'expectedImpact' must be a map of component to score");
      return;
    }
    for (const auto & entry : node) {
      if (!entry.first.IsScalar()) {
        malformed(entry.first, "'expectedImpact' keys must be component names");
        continue;
      }
      const auto value = yaml_number(entry.second);
      if (!value || !std::isfinite(*value)) {
        malformed(
          entry.second, "expected impact for '" + entry.first.Scalar() + "' must be a number");
        continue;
      }
      spec.expected_impact[entry.first.Scalar()] = *value;
    }
  }

  FileId file_;
  DiagnosticBag & diags_;
  bool failed_ = false;
};

}  // namespace

std::optional<ChangeSpecification> load_change_specification(
  const std::filesystem::path & path, SourceRegistry & sources, DiagnosticBag & diags)
{
  auto doc = load_yaml_file(path, sources, diags);
  if (!doc) {
    return std::nullopt;
  }
  return ChangeSpecReader(doc->file_id, diags).read(doc->root);
}

std::optional<ChangeSpecification> parse_change_specification(
  const std::filesystem::path & path, std::string content, SourceRegistry & sources,
  DiagnosticBag & diags)
{
  auto doc = parse_yaml(path, std::move(content), sources, diags);
  if (!doc) {
    return std::nullopt;
  }
  return ChangeSpecReader(doc->file_id, diags).read(doc->root);
}

}  // namespace ripple
