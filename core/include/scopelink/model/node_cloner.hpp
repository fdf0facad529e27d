// scopelink/model/node_cloner.hpp - Structural copies of model trees
//
#pragma once

#include <gsl/span>
#include <optional>
#include <vector>

#include "scopelink/model/model.hpp"
#include "scopelink/model/model_context.hpp"
#include "scopelink/model/visitor.hpp"

namespace scopelink
{

/**
 * Deep-copies a subtree into a target ModelContext.
 *
 * Every copied node gets a fresh id from the target context, in pre-order
 * (a node before its children, children in declaration order). Names are
 * re-interned in the target, so the copy does not depend on the source
 * context. Link-time fields other than the id are left empty; a copied
 * Environment points at the target context.
 */
class NodeCloner : public ConstModelVisitor<NodeCloner, Node *>
{
public:
  explicit NodeCloner(ModelContext & target) : target_(target) {}

  /// Copy `node` and its whole subtree. Returns nullptr for nullptr.
  [[nodiscard]] Node * clone(const Node * node) { return visit(node); }

  template <typename T>
  [[nodiscard]] T * clone_as(const T * node)
  {
    return cast_or_null<T>(visit(node));
  }

  Node * visit_environment(const Environment * node);
  Node * visit_package(const Package * node);
  Node * visit_program(const Program * node);
  Node * visit_test(const Test * node);
  Node * visit_class(const Class * node);
  Node * visit_singleton(const Singleton * node);
  Node * visit_mixin(const Mixin * node);
  Node * visit_describe(const Describe * node);
  Node * visit_variable(const Variable * node);
  Node * visit_return(const Return * node);
  Node * visit_assignment(const Assignment * node);
  Node * visit_reference(const Reference * node);
  Node * visit_self(const Self * node);
  Node * visit_literal(const Literal * node);
  Node * visit_send(const Send * node);
  Node * visit_new(const New * node);
  Node * visit_if(const If * node);
  Node * visit_throw(const Throw * node);
  Node * visit_field(const Field * node);
  Node * visit_method(const Method * node);
  Node * visit_parameter(const Parameter * node);
  Node * visit_import(const Import * node);
  Node * visit_body(const Body * node);
  Node * visit_parameterized_type(const ParameterizedType * node);

private:
  template <typename T>
  T * stamp(T * copy)
  {
    copy->id = target_.next_id();
    return copy;
  }

  template <typename T>
  gsl::span<T *> clone_all(gsl::span<T *> source)
  {
    auto result = target_.allocate_array<T *>(source.size());
    auto out = result.begin();
    for (const T * child : source) {
      *out = clone_as<T>(child);
      ++out;
    }
    return result;
  }

  /// Shared by the four module kinds.
  void clone_module_parts(const Module * source, Module * copy);

  gsl::span<Problem> clone_problems(gsl::span<Problem> source);

  ModelContext & target_;
};

/**
 * Replacement parts for copy_package(). Unset parts are taken from the source.
 */
struct PackageOverrides
{
  std::optional<std::vector<Entity *>> members;
  std::optional<gsl::span<Import *>> imports;
  std::optional<gsl::span<Problem>> problems;
};

/**
 * Shallow copy of a Package allocated in `ctx`, with some parts replaced.
 *
 * Children are shared with the source, not copied; link-time fields are empty.
 * Used to build merged packages before the whole tree is deep-copied.
 */
[[nodiscard]] Package * copy_package(
  ModelContext & ctx, const Package & source, const PackageOverrides & overrides = {});

}  // namespace scopelink
