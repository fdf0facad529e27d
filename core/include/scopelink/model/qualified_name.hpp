// scopelink/model/qualified_name.hpp - Naming nodes by their enclosing entities
//
#pragma once

#include <string>

#include "scopelink/model/model.hpp"

namespace scopelink
{

/**
 * Dotted name of the innermost named entity enclosing `node` (itself
 * included), built from parent back references: "p.q.A" for class A in
 * sub-package q of p. Anonymous entities are skipped. Empty for the
 * Environment, for detached nodes and for nullptr.
 */
[[nodiscard]] std::string qualified_name(const Node * node);

/// Innermost Package enclosing `node` (itself included), or nullptr.
[[nodiscard]] const Package * enclosing_package(const Node * node);

}  // namespace scopelink
