// scopelink/driver/reference_checker.hpp - Reporting references that do not resolve
//
#pragma once

#include <cstddef>

#include "scopelink/basic/diagnostic.hpp"
#include "scopelink/model/model.hpp"

namespace scopelink
{

/// Code of the diagnostic reported for an unresolved reference.
inline constexpr const char * k_missing_reference = "missingReference";

/**
 * Walks a linked Environment and reports every Reference whose name does not
 * resolve from its own scope.
 *
 * The linker treats absence as a normal result; this check is what turns it
 * into a diagnostic for tools that want one.
 */
class ReferenceChecker
{
public:
  explicit ReferenceChecker(DiagnosticBag & diags) : diags_(diags) {}

  /**
   * Check every reference under `root`.
   *
   * @return Number of unresolved references reported
   */
  size_t check(const Node & root);

private:
  DiagnosticBag & diags_;
};

}  // namespace scopelink
