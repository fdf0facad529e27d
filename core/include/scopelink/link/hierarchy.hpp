// scopelink/link/hierarchy.hpp - Supertype linearization used by the scope builder
//
#pragma once

#include <functional>
#include <vector>

#include "scopelink/model/model.hpp"

namespace scopelink
{

/**
 * Produces the linearized hierarchy of a module: the module itself first,
 * followed by the modules it inherits from, most specific first.
 *
 * The scope builder calls the provider during its second pass, when every
 * node already has its own scope but imports and inheritance are only wired
 * for the nodes visited before `module`.
 */
using HierarchyProvider = std::function<std::vector<Module *>(Module & module)>;

/**
 * Default provider.
 *
 * Each supertype reference is resolved from its own scope. Supertypes are
 * expanded depth first in declaration order; a module already collected is
 * skipped, so cyclic declarations terminate. Unresolved supertypes are left out.
 */
[[nodiscard]] std::vector<Module *> supertype_hierarchy(Module & module);

}  // namespace scopelink
