// scopelink/link/linker.hpp - Linking parsed packages into an Environment
//
#pragma once

#include <array>
#include <gsl/span>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "scopelink/basic/id_generator.hpp"
#include "scopelink/link/hierarchy.hpp"
#include "scopelink/model/model.hpp"
#include "scopelink/model/model_context.hpp"

namespace scopelink
{

/// Packages whose members are visible everywhere, in resolution order.
inline constexpr std::array<std::string_view, 3> k_default_global_packages = {
  "std.lang", "std.lib", "std.game"};

struct LinkOptions
{
  /// Qualified names of the global packages, in order
  std::vector<std::string> global_packages{
    k_default_global_packages.begin(), k_default_global_packages.end()};

  IdStrategy id_strategy = IdStrategy::Counter;
};

/**
 * A linked Environment together with the context that owns it.
 *
 * Every node, interned name and scope reachable from `environment` lives in
 * `context`; the Environment is valid as long as the context is.
 */
struct LinkedEnvironment
{
  std::unique_ptr<ModelContext> context;
  Environment * environment = nullptr;

  [[nodiscard]] explicit operator bool() const noexcept { return environment != nullptr; }
};

/**
 * Merges new packages into an optional base Environment and produces a fresh,
 * fully linked Environment.
 *
 * Pipeline: PackageMerger -> IdentityAssigner -> ScopeBuilder.
 *
 * The base and the incoming packages are never modified. Every node of the
 * result has a new identity, including nodes copied from untouched packages,
 * and no identity of the base is reused.
 */
class Linker
{
public:
  explicit Linker(LinkOptions options = {}, HierarchyProvider hierarchy = supertype_hierarchy);

  [[nodiscard]] LinkedEnvironment link(
    gsl::span<Package * const> new_packages, const Environment * base = nullptr) const;

  [[nodiscard]] const LinkOptions & options() const noexcept { return options_; }

private:
  LinkOptions options_;
  HierarchyProvider hierarchy_;
};

/// Link with a default-constructed Linker configured by `options`.
[[nodiscard]] LinkedEnvironment link(
  gsl::span<Package * const> new_packages, const Environment * base = nullptr,
  const LinkOptions & options = {});

}  // namespace scopelink
