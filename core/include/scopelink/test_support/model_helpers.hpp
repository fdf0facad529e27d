// scopelink/test_support/model_helpers.hpp - helpers for unit/integration tests
//
// Model trees come from an external front end, so tests describe them as JSON
// text and read them with ModelReader. Ownership stays explicit: the context
// holding the parsed trees travels with them in TestModelUnit.
//
#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "scopelink/basic/casting.hpp"
#include "scopelink/basic/diagnostic.hpp"
#include "scopelink/model/json_reader.hpp"
#include "scopelink/model/model.hpp"
#include "scopelink/model/model_context.hpp"
#include "scopelink/model/traversal.hpp"

namespace scopelink::test_support
{

struct TestModelUnit
{
  std::unique_ptr<ModelContext> ctx;
  DiagnosticBag diags;
  std::vector<Package *> packages;

  /// Read more packages into the same context.
  std::vector<Package *> read(std::string_view json_text)
  {
    ModelReader reader(*ctx, diags, "<test>");
    return reader.read_packages_text(json_text);
  }

  /// Read a sentence into the same context.
  Node * read_sentence(std::string_view json_text)
  {
    ModelReader reader(*ctx, diags, "<test>");
    return reader.read_sentence_text(json_text);
  }
};

/**
 * Read a package object or an array of packages from JSON text.
 */
[[nodiscard]] inline TestModelUnit read_model(std::string_view json_text)
{
  TestModelUnit out;
  out.ctx = std::make_unique<ModelContext>();
  out.packages = out.read(json_text);
  return out;
}

/**
 * First node of type T named `name` under `root`, in pre-order, or nullptr.
 */
template <typename T>
[[nodiscard]] T * find_named(Node * root, std::string_view name)
{
  T * found = nullptr;
  walk_preorder(root, [&](Node * node, Node * /*parent*/) {
    if (found != nullptr) {
      return;
    }
    auto * typed = dyn_cast<T>(node);
    if (typed != nullptr && contributed_name(typed) == name) {
      found = typed;
    }
  });
  return found;
}

/// Every node of type T under `root`, in pre-order.
template <typename T>
[[nodiscard]] std::vector<T *> find_all(Node * root)
{
  std::vector<T *> found;
  walk_preorder(root, [&](Node * node, Node * /*parent*/) {
    if (auto * typed = dyn_cast<T>(node)) {
      found.push_back(typed);
    }
  });
  return found;
}

}  // namespace scopelink::test_support
