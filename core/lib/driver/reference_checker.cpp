// scopelink/driver/reference_checker.cpp - Reporting references that do not resolve
//
#include "scopelink/driver/reference_checker.hpp"

#include <fmt/core.h>

#include <string>

#include "scopelink/basic/casting.hpp"
#include "scopelink/link/link_error.hpp"
#include "scopelink/link/scope.hpp"
#include "scopelink/model/qualified_name.hpp"
#include "scopelink/model/traversal.hpp"

namespace scopelink
{

size_t ReferenceChecker::check(const Node & root)
{
  size_t unresolved = 0;
  walk_preorder(&root, [&](const Node * node, const Node * /*parent*/) {
    const auto * ref = dyn_cast<Reference>(node);
    if (ref == nullptr || ref->scope == nullptr) {
      return;
    }
    if (ref->scope->resolve(ref->name) != nullptr) {
      return;
    }

    ++unresolved;
    const std::string name(ref->name);
    Diagnostic diag = LinkError(k_missing_reference)
                        .to_diagnostic(fmt::format("cannot resolve reference '{}'", name));
    diag.values.push_back(name);
    if (const Package * pkg = enclosing_package(ref); pkg != nullptr && !pkg->fileName.empty()) {
      diag.file = std::string(pkg->fileName);
    }
    if (auto subject = qualified_name(ref); !subject.empty()) {
      diag.subject = std::move(subject);
    }
    diags_.add(std::move(diag));
  });
  return unresolved;
}

}  // namespace scopelink
