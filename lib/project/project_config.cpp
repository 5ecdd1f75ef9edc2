// ripple/project/project_config.cpp - Project configuration implementation
//
#include "ripple/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>

#include "ripple/basic/yaml_source.hpp"

namespace ripple
{

namespace
{

/// Read an optional string key; false (with error set) if present but not a scalar
bool read_string(
  const YAML::Node & section, const char * key, const std::string & qualified,
  std::optional<std::string> & out, std::string & error)
{
  const YAML::Node node = section[key];
  if (!node || node.IsNull()) {
    return true;
  }
  if (!node.IsScalar()) {
    error = qualified + " must be a string";
    return false;
  }
  out = node.Scalar();
  return true;
}

bool read_number(
  const YAML::Node & section, const char * key, const std::string & qualified,
  std::optional<double> & out, std::string & error)
{
  const YAML::Node node = section[key];
  if (!node || node.IsNull()) {
    return true;
  }
  const auto value = yaml_number(node);
  if (!value || !std::isfinite(*value)) {
    error = qualified + " must be a number";
    return false;
  }
  out = value;
  return true;
}

bool check_section(const YAML::Node & root, const char * name, std::string & error)
{
  const YAML::Node node = root[name];
  if (node && !node.IsNull() && !node.IsMap()) {
    error = std::string(name) + " must be a map";
    return false;
  }
  return true;
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  // An empty file is a valid, all-defaults configuration.
  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("ripple.yaml must be a map");
  }

  std::string error;
  for (const char * section : {"project", "structure", "contracts", "analysis", "output"}) {
    if (!check_section(root, section, error)) {
      return ConfigLoadResult::fail(error);
    }
  }

  // Parse 'project' section
  if (const YAML::Node project = root["project"]; project && project.IsMap()) {
    std::optional<std::string> name;
    if (!read_string(project, "name", "project.name", name, error)) {
      return ConfigLoadResult::fail(error);
    }
    config.name = name.value_or("");
  }

  // Parse 'structure' section
  if (const YAML::Node structure = root["structure"]; structure && structure.IsMap()) {
    std::optional<std::string> manifest;
    if (!read_string(structure, "manifest", "structure.manifest", manifest, error)) {
      return ConfigLoadResult::fail(error);
    }
    if (manifest) {
      config.manifest = config.project_root / *manifest;
    }
  }

  // Parse 'contracts' section
  if (const YAML::Node contracts = root["contracts"]; contracts && contracts.IsMap()) {
    std::optional<std::string> dir;
    if (!read_string(contracts, "directory", "contracts.directory", dir, error)) {
      return ConfigLoadResult::fail(error);
    }
    if (dir) {
      config.contracts_dir = config.project_root / *dir;
    }
  }

  // Parse 'analysis' section
  if (const YAML::Node analysis = root["analysis"]; analysis && analysis.IsMap()) {
    std::optional<double> damping;
    std::optional<double> max_iterations;
    std::optional<double> tolerance;
    if (
      !read_number(analysis, "damping", "analysis.damping", damping, error) ||
      !read_number(analysis, "max_iterations", "analysis.max_iterations", max_iterations, error) ||
      !read_number(analysis, "tolerance", "analysis.tolerance", tolerance, error)) {
      return ConfigLoadResult::fail(error);
    }

    if (damping) {
      if (*damping <= 0.0 || *damping >= 1.0) {
        return ConfigLoadResult::fail("invalid analysis.damping: must be between 0 and 1");
      }
      config.analysis.damping = *damping;
    }
    if (max_iterations) {
      if (*max_iterations < 1.0 || *max_iterations != std::floor(*max_iterations)) {
        return ConfigLoadResult::fail("invalid analysis.max_iterations: must be an integer >= 1");
      }
      config.analysis.max_iterations = static_cast<uint32_t>(*max_iterations);
    }
    if (tolerance) {
      if (*tolerance <= 0.0) {
        return ConfigLoadResult::fail("invalid analysis.tolerance: must be greater than 0");
      }
      config.analysis.tolerance = *tolerance;
    }
  }

  // Parse 'output' section
  if (const YAML::Node output = root["output"]; output && output.IsMap()) {
    std::optional<std::string> format;
    if (!read_string(output, "format", "output.format", format, error)) {
      return ConfigLoadResult::fail(error);
    }
    if (format) {
      const auto parsed = parse_output_format(*format);
      if (!parsed) {
        return ConfigLoadResult::fail(
          "invalid output.format: '" + *format + "' (must be 'yaml' or 'json')");
      }
      config.format = *parsed;
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

std::string default_project_config_text(const std::string & project_name)
{
  return "project:\n"
         "  name: '" + project_name + "'\n\n"
         "structure:\n"
         "  manifest: './components.yaml'\n\n"
         "contracts:\n"
         "  directory: './contracts'\n\n"
         "analysis:\n"
         "  damping: 0.85\n"
         "  max_iterations: 100\n"
         "  tolerance: 0.0001\n\n"
         "output:\n"
         "  format: 'yaml'\n";
}

}  // namespace ripple
