// scopelink/driver/link_driver.hpp - Link driver
//
// Single entry point for the read -> link -> check pipeline.
// Used by the CLI and usable from other tools.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include "scopelink/basic/diagnostic.hpp"
#include "scopelink/link/linker.hpp"
#include "scopelink/model/model_context.hpp"
#include "scopelink/project/link_config.hpp"

namespace scopelink
{

// ============================================================================
// Driver Options
// ============================================================================

struct DriverOptions
{
  /// Project configuration file; built-in defaults when absent
  std::optional<std::filesystem::path> config_path;

  /// Model files linked after the configuration's inputs
  std::vector<std::filesystem::path> inputs;

  /// Model files linked first; `inputs` are then relinked on top of them
  std::vector<std::filesystem::path> base_inputs;

  /// Prepend the standard library model when it can be found
  bool auto_detect_stdlib = true;

  /// Overrides check.unresolved_references from the configuration
  std::optional<bool> check_references;

  /// Print pipeline progress on stderr (also enabled by the configuration)
  bool verbose = false;
};

// ============================================================================
// Driver Result
// ============================================================================

struct DriverResult
{
  /// Whether the pipeline succeeded (no errors)
  bool success = false;

  /// Collected diagnostics (config, model format, package problems, references)
  DiagnosticBag diagnostics;

  /// Effective configuration
  LinkConfig config;

  /// Context holding the parsed input trees
  std::unique_ptr<ModelContext> sources;

  /// The linked Environment (empty if reading failed)
  LinkedEnvironment linked;

  /// Number of references reported as unresolved
  size_t unresolved_references = 0;
};

// ============================================================================
// LinkDriver
// ============================================================================

/**
 * Driver that orchestrates the full pipeline.
 *
 * The pipeline consists of:
 * 1. Configuration loading
 * 2. Reading the model files (standard library first when found)
 * 3. Linking, optionally on top of a base Environment
 * 4. Reporting the problems recorded on every package
 * 5. Reporting unresolved references (when enabled)
 */
class LinkDriver
{
public:
  [[nodiscard]] static DriverResult run(const DriverOptions & options);

private:
  static bool read_inputs(
    const std::vector<std::filesystem::path> & files, ModelContext & ctx,
    std::vector<Package *> & packages, DiagnosticBag & diags);

  static void report_package_problems(const Environment & env, DiagnosticBag & diags);
};

}  // namespace scopelink
