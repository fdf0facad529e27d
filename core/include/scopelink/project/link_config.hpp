// scopelink/project/link_config.hpp - Project configuration (scopelink.yaml)
//
// Parses and validates scopelink.yaml files. Shared by the driver and the CLI.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "scopelink/link/linker.hpp"

namespace scopelink
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Checks run by the driver after linking.
 */
struct CheckConfig
{
  /// Report references that do not resolve from their own scope
  bool unresolved_references = true;
};

/**
 * Complete project configuration (scopelink.yaml).
 */
struct LinkConfig
{
  /// `link` section: global packages and identity strategy
  LinkOptions link;

  /// Print pipeline progress on stderr
  bool verbose = false;

  CheckConfig check;

  /// Model files to link, in order (absolute once loaded)
  std::vector<std::filesystem::path> inputs;

  /// Directory containing scopelink.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  LinkConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(LinkConfig cfg)
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
 * Load a project configuration from a scopelink.yaml file.
 *
 * @param config_path Path to scopelink.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_link_config(const std::filesystem::path & config_path);

/**
 * Parse configuration text.
 *
 * @param yaml_text Contents of a scopelink.yaml file
 * @param project_root Directory relative input paths are resolved against
 */
[[nodiscard]] ConfigLoadResult parse_link_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to scopelink.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_link_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_link_config_file_name = "scopelink.yaml";

}  // namespace scopelink
