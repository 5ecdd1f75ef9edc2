// ripple/structure/component_manifest.cpp - YAML component manifest reader
#include "ripple/structure/component_manifest.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

#include "ripple/basic/errors.hpp"
#include "ripple/basic/yaml_source.hpp"

namespace ripple
{

namespace
{

constexpr const char * k_collaborator_name = "component manifest";

[[noreturn]] void fail(const std::string & where, const std::string & message)
{
  throw CollaboratorError(k_collaborator_name, where + ": " + message);
}

ComponentInfo parse_component(const YAML::Node & node, const std::filesystem::path & origin)
{
  if (!node.IsMap()) {
    fail(yaml_location(origin, node), "component entry must be a map");
  }

  const YAML::Node name = node["name"];
  if (!name || !name.IsScalar() || name.Scalar().empty()) {
    fail(yaml_location(origin, node), "component entry must have a 'name'");
  }

  ComponentInfo info;
  info.name = name.Scalar();

  const YAML::Node deps = node["dependencies"];
  if (!deps || deps.IsNull()) {
    return info;
  }
  if (!deps.IsSequence()) {
    fail(yaml_location(origin, deps), "'dependencies' of " + info.name + " must be a list");
  }
  for (const auto & dep : deps) {
    if (!dep.IsScalar() || dep.Scalar().empty()) {
      fail(yaml_location(origin, dep), "dependency names must be non-empty strings");
    }
    info.dependencies.push_back(dep.Scalar());
  }

  return info;
}

}  // namespace

std::vector<ComponentInfo> ComponentManifestProvider::list_components()
{
  std::ifstream in(manifest_path_, std::ios::binary);
  if (!in.is_open()) {
    fail(manifest_path_.string(), "cannot open component manifest");
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  return parse(buffer.str(), manifest_path_);
}

std::vector<ComponentInfo> ComponentManifestProvider::parse(
  const std::string & content, const std::filesystem::path & origin)
{
  YAML::Node root;
  try {
    root = YAML::Load(content);
  } catch (const YAML::Exception & e) {
    fail(origin.string(), std::string("invalid YAML: ") + e.what());
  }

  if (!root.IsMap() || !root["components"]) {
    fail(origin.string(), "manifest must have a 'components' list");
  }

  const YAML::Node list = root["components"];
  if (list.IsNull()) {
    return {};
  }
  if (!list.IsSequence()) {
    fail(yaml_location(origin, list), "'components' must be a list");
  }

  std::vector<ComponentInfo> components;
  components.reserve(list.size());
  for (const auto & entry : list) {
    components.push_back(parse_component(entry, origin));
  }
  return components;
}

}  // namespace ripple
