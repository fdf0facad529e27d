// scopelink/driver/link_driver.cpp - Link driver implementation
//
#include "scopelink/driver/link_driver.hpp"

#include <fmt/core.h>

#include <iostream>
#include <string>
#include <utility>

#include "scopelink/basic/casting.hpp"
#include "scopelink/driver/reference_checker.hpp"
#include "scopelink/driver/stdlib_finder.hpp"
#include "scopelink/model/json_reader.hpp"
#include "scopelink/model/qualified_name.hpp"
#include "scopelink/model/traversal.hpp"

namespace scopelink
{

bool LinkDriver::read_inputs(
  const std::vector<std::filesystem::path> & files, ModelContext & ctx,
  std::vector<Package *> & packages, DiagnosticBag & diags)
{
  bool ok = true;
  for (const auto & file : files) {
    const size_t errors_before = diags.errors().size();
    auto read = read_model_file(file, ctx, diags);
    if (diags.errors().size() != errors_before) {
      ok = false;
      continue;
    }
    packages.insert(packages.end(), read.begin(), read.end());
  }
  return ok;
}

void LinkDriver::report_package_problems(const Environment & env, DiagnosticBag & diags)
{
  walk_preorder(&env, [&diags](const Node * node, const Node * /*parent*/) {
    const auto * pkg = dyn_cast<Package>(node);
    if (pkg == nullptr) {
      return;
    }
    for (const Problem & problem : pkg->problems) {
      Diagnostic diag;
      diag.severity = problem.level;
      diag.code = std::string(problem.code);
      diag.message = fmt::format("{} in package '{}'", problem.code, qualified_name(pkg));
      for (std::string_view value : problem.values) {
        diag.values.emplace_back(value);
      }
      if (!pkg->fileName.empty()) {
        diag.file = std::string(pkg->fileName);
      }
      diag.subject = qualified_name(pkg);
      diags.add(std::move(diag));
    }
  });
}

DriverResult LinkDriver::run(const DriverOptions & options)
{
  namespace fs = std::filesystem;

  DriverResult result;

  // Configuration
  if (options.config_path) {
    auto loaded = load_link_config(*options.config_path);
    if (!loaded.success) {
      result.diagnostics.report_error(loaded.error)
        .with_code("invalidConfig")
        .in_file(options.config_path->string());
      return result;
    }
    result.config = std::move(loaded.config);
  }
  const bool verbose = options.verbose || result.config.verbose;
  const bool check_references =
    options.check_references.value_or(result.config.check.unresolved_references);

  // Inputs
  std::vector<fs::path> base_files;
  if (options.auto_detect_stdlib) {
    if (auto stdlib = find_stdlib_model()) {
      base_files.push_back(*stdlib);
      if (verbose) {
        std::cerr << "scopelink: using standard library " << stdlib->string() << "\n";
      }
    }
  }
  base_files.insert(base_files.end(), options.base_inputs.begin(), options.base_inputs.end());

  std::vector<fs::path> files = result.config.inputs;
  files.insert(files.end(), options.inputs.begin(), options.inputs.end());

  if (files.empty() && options.base_inputs.empty()) {
    result.diagnostics.report_error("no model files to link").with_code("noInputs");
    return result;
  }

  result.sources = std::make_unique<ModelContext>();
  std::vector<Package *> base_packages;
  std::vector<Package *> packages;
  const bool base_ok = read_inputs(base_files, *result.sources, base_packages, result.diagnostics);
  const bool inputs_ok = read_inputs(files, *result.sources, packages, result.diagnostics);
  if (!base_ok || !inputs_ok) {
    return result;
  }

  // Link
  const Linker linker(result.config.link);
  if (base_packages.empty()) {
    result.linked = linker.link(packages);
  } else {
    LinkedEnvironment base = linker.link(base_packages);
    if (verbose) {
      std::cerr << fmt::format(
        "scopelink: linked base of {} packages, {} nodes\n", base_packages.size(),
        count_nodes(base.environment));
    }
    result.linked = linker.link(packages, base.environment);
  }
  if (verbose) {
    std::cerr << fmt::format(
      "scopelink: linked {} packages, {} nodes\n", packages.size(),
      count_nodes(result.linked.environment));
  }

  // Checks
  report_package_problems(*result.linked.environment, result.diagnostics);
  if (check_references) {
    ReferenceChecker checker(result.diagnostics);
    result.unresolved_references = checker.check(*result.linked.environment);
    if (verbose) {
      std::cerr << fmt::format(
        "scopelink: {} unresolved references\n", result.unresolved_references);
    }
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

}  // namespace scopelink
