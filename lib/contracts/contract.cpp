// ripple/contracts/contract.cpp - Contract schemas and required-field rules
#include "ripple/contracts/contract.hpp"

#include <algorithm>
#include <cctype>

namespace ripple
{

namespace
{

std::string lowercase(std::string_view text)
{
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

ContractField read_field(const YAML::Node & map, const char * key)
{
  const YAML::Node value = map[key];
  if (!value || value.IsNull()) {
    return std::nullopt;
  }
  if (value.IsScalar()) {
    return value.Scalar();
  }
  // Present but structured: counts as given, content is not inspected.
  return std::string();
}

struct ShapeReader
{
  const YAML::Node & root;
  std::vector<std::string> & errors;

  std::vector<ContractEntry> entries(const char * key, const char * first, const char * second)
  {
    std::vector<ContractEntry> out;
    const YAML::Node list = root[key];
    if (!list || list.IsNull()) {
      return out;
    }
    if (!list.IsSequence()) {
      errors.push_back(std::string("'") + key + "' must be a list");
      return out;
    }
    out.reserve(list.size());
    for (const auto & item : list) {
      if (!item.IsMap()) {
        // Scalars and lists carry neither field.
        out.push_back(ContractEntry{});
        continue;
      }
      out.push_back(ContractEntry{read_field(item, first), read_field(item, second)});
    }
    return out;
  }
};

void require_entries(
  const std::vector<ContractEntry> & entries, const char * message,
  std::vector<std::string> & errors)
{
  const bool incomplete = std::any_of(entries.begin(), entries.end(), [](const auto & e) {
    return !e.first.has_value() || !e.second.has_value();
  });
  if (incomplete) {
    errors.emplace_back(message);
  }
}

void require_header(
  const ContractField & name, const ContractField & version, std::string_view kind_label,
  std::vector<std::string> & errors)
{
  if (!name) {
    errors.push_back(std::string(kind_label) + " contract must have a name");
  }
  if (!version) {
    errors.push_back(std::string(kind_label) + " contract must have a version");
  }
}

struct RuleChecker
{
  std::vector<std::string> & errors;

  void operator()(const InterfaceContract & c) const
  {
    require_header(c.name, c.version, "Interface", errors);
    require_entries(c.inputs, "Interface inputs must have name and type", errors);
    require_entries(c.outputs, "Interface outputs must have name and type", errors);
  }

  void operator()(const BehaviorContract & c) const
  {
    require_header(c.name, c.version, "Behavior", errors);
    require_entries(c.operations, "Operations must have name and description", errors);
    require_entries(
      c.concurrency_rules, "Concurrency rules must have type and description", errors);
    require_entries(
      c.performance_constraints, "Performance constraints must have metric and threshold", errors);
  }

  void operator()(const ResourceContract & c) const
  {
    require_header(c.name, c.version, "Resource", errors);
    require_entries(
      c.resource_requirements, "Resource requirements must have type and specification", errors);
    require_entries(c.access_patterns, "Access patterns must have type and description", errors);
    require_entries(c.scaling_rules, "Scaling rules must have trigger and action", errors);
  }
};

}  // namespace

std::optional<ContractKind> parse_contract_kind(std::string_view text)
{
  const std::string lower = lowercase(text);
  if (lower == "interface") {
    return ContractKind::Interface;
  }
  if (lower == "behavior") {
    return ContractKind::Behavior;
  }
  if (lower == "resource") {
    return ContractKind::Resource;
  }
  return std::nullopt;
}

std::string_view to_string(ContractKind kind) noexcept
{
  switch (kind) {
    case ContractKind::Interface:
      return "interface";
    case ContractKind::Behavior:
      return "behavior";
    case ContractKind::Resource:
      return "resource";
  }
  return "unknown";
}

ContractParseResult parse_contract(const YAML::Node & root, ContractKind kind)
{
  ContractParseResult result;

  if (!root.IsMap()) {
    result.errors.emplace_back("Contract document must be a map");
    return result;
  }

  ShapeReader reader{root, result.errors};

  switch (kind) {
    case ContractKind::Interface: {
      InterfaceContract c;
      c.name = read_field(root, "name");
      c.version = read_field(root, "version");
      c.inputs = reader.entries("inputs", "name", "type");
      c.outputs = reader.entries("outputs", "name", "type");

      const YAML::Node ext = root["extensionPoints"];
      if (ext && !ext.IsNull()) {
        if (!ext.IsSequence()) {
          result.errors.emplace_back("Extension points must be a list");
        } else {
          for (const auto & point : ext) {
            c.extension_points.push_back(point.IsScalar() ? point.Scalar() : std::string());
          }
        }
      }
      result.document = std::move(c);
      break;
    }
    case ContractKind::Behavior: {
      BehaviorContract c;
      c.name = read_field(root, "name");
      c.version = read_field(root, "version");
      c.operations = reader.entries("operations", "name", "description");
      c.concurrency_rules = reader.entries("concurrencyRules", "type", "description");
      c.performance_constraints =
        reader.entries("performanceConstraints", "metric", "threshold");
      result.document = std::move(c);
      break;
    }
    case ContractKind::Resource: {
      ResourceContract c;
      c.name = read_field(root, "name");
      c.version = read_field(root, "version");
      c.resource_requirements =
        reader.entries("resourceRequirements", "type", "specification");
      c.access_patterns = reader.entries("accessPatterns", "type", "description");
      c.scaling_rules = reader.entries("scalingRules", "trigger", "action");
      result.document = std::move(c);
      break;
    }
  }

  if (!result.errors.empty()) {
    result.document.reset();
  }
  return result;
}

std::vector<std::string> check_contract_rules(const ContractDocument & document)
{
  std::vector<std::string> errors;
  std::visit(RuleChecker{errors}, document);
  return errors;
}

}  // namespace ripple
