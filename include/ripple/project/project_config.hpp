// ripple/project/project_config.hpp - Project configuration (ripple.yaml)
//
// Parses and validates ripple.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "ripple/impact/impact_propagator.hpp"
#include "ripple/output/result_writer.hpp"

namespace ripple
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Complete project configuration (ripple.yaml).
 *
 * Every key is optional. Paths are resolved against project_root.
 */
struct ProjectConfig
{
  std::string name;

  /// Component manifest read by ComponentManifestProvider
  std::optional<std::filesystem::path> manifest;

  /// Directory of contract documents read by FileContractValidator
  std::optional<std::filesystem::path> contracts_dir;

  PropagationOptions analysis;

  OutputFormat format = OutputFormat::Yaml;

  /// Directory containing ripple.yaml
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a ripple.yaml file.
 *
 * @param config_path Path to ripple.yaml
 * @return ConfigLoadResult with the loaded config or an error naming the bad key
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find ripple.yaml by searching upward from start_dir to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Starter ripple.yaml written by `ripple init`.
 */
[[nodiscard]] std::string default_project_config_text(const std::string & project_name);

inline constexpr const char * k_project_config_file_name = "ripple.yaml";

}  // namespace ripple
