// scopelink/link/scope_builder.hpp - Scope graph construction over a stamped Environment
//
#pragma once

#include <string>
#include <vector>

#include "scopelink/link/hierarchy.hpp"
#include "scopelink/model/model.hpp"
#include "scopelink/model/model_context.hpp"

namespace scopelink
{

/**
 * Builds the scope of every node of an Environment in two pre-order passes.
 *
 * Pass 1 gives each node a scope whose container is its parent's scope (the
 * grandparent's scope for imports and for references under a parameterized
 * type) and registers the node's contribution into its parent's scope.
 *
 * Pass 2 wires what depends on resolution. The members of each global package
 * are registered into the root scope and each resolved import adds an included
 * scope to its package. Only once every import is wired does each module
 * include the scopes of its hierarchy, after itself, so that a hierarchy does
 * not depend on the order of the packages.
 *
 * Parent back references must already be set.
 */
class ScopeBuilder
{
public:
  ScopeBuilder(
    ModelContext & ctx, std::vector<std::string> global_packages, HierarchyProvider hierarchy);

  void build(Environment & root);

private:
  void create_scopes(Environment & root);
  void wire_scopes(Environment & root);

  void inject_global_packages(Environment & root);
  void include_imports(Package & pkg);
  void include_hierarchy(Module & module);

  ModelContext & ctx_;
  std::vector<std::string> global_packages_;
  HierarchyProvider hierarchy_;
};

}  // namespace scopelink
