// scopelink/link/scope_builder.cpp - Scope graph construction
//
#include "scopelink/link/scope_builder.hpp"

#include <utility>

#include "scopelink/basic/casting.hpp"
#include "scopelink/link/scope.hpp"
#include "scopelink/model/traversal.hpp"

namespace scopelink
{

namespace
{

/// Scope a freshly created scope of `node` looks up into.
Scope * container_scope_for(const Node * node, const Node * parent)
{
  if (parent == nullptr) {
    return nullptr;
  }
  const bool from_grandparent =
    isa<Import>(node) || (isa<Reference>(node) && isa<ParameterizedType>(parent));
  if (from_grandparent) {
    return parent->parent != nullptr ? parent->parent->scope : nullptr;
  }
  return parent->scope;
}

}  // namespace

ScopeBuilder::ScopeBuilder(
  ModelContext & ctx, std::vector<std::string> global_packages, HierarchyProvider hierarchy)
: ctx_(ctx), global_packages_(std::move(global_packages)), hierarchy_(std::move(hierarchy))
{
  if (!hierarchy_) {
    hierarchy_ = supertype_hierarchy;
  }
}

void ScopeBuilder::build(Environment & root)
{
  create_scopes(root);
  wire_scopes(root);
}

void ScopeBuilder::create_scopes(Environment & root)
{
  walk_preorder(static_cast<Node *>(&root), [this](Node * node, Node * parent) {
    node->scope = ctx_.create_scope(container_scope_for(node, parent));
    if (parent != nullptr && parent->scope != nullptr) {
      parent->scope->register_node(node);
    }
  });
}

void ScopeBuilder::wire_scopes(Environment & root)
{
  // Every import is in place before any hierarchy resolves a supertype
  walk_preorder(static_cast<Node *>(&root), [this](Node * node, Node * /*parent*/) {
    if (auto * env = dyn_cast<Environment>(node)) {
      inject_global_packages(*env);
    }
    if (auto * pkg = dyn_cast<Package>(node)) {
      include_imports(*pkg);
    }
  });
  walk_preorder(static_cast<Node *>(&root), [this](Node * node, Node * /*parent*/) {
    if (auto * module = dyn_cast<Module>(node)) {
      include_hierarchy(*module);
    }
  });
}

void ScopeBuilder::inject_global_packages(Environment & root)
{
  for (const std::string & name : global_packages_) {
    const auto * global = root.scope->resolve_as<Package>(name);
    if (global == nullptr) {
      continue;
    }
    for (Entity * member : global->members) {
      root.scope->register_node(member);
    }
  }
}

void ScopeBuilder::include_imports(Package & pkg)
{
  for (const Import * import : pkg.imports) {
    if (import->entity == nullptr || import->scope == nullptr) {
      continue;
    }
    Node * entity = import->scope->resolve(import->entity->name);
    if (entity == nullptr) {
      continue;
    }

    Scope * imported = ctx_.create_scope();
    if (import->isGeneric) {
      if (entity->scope != nullptr) {
        imported->register_all(entity->scope->local_contributions());
      }
    } else {
      imported->register_node(entity);
    }
    pkg.scope->include(imported);
  }
}

void ScopeBuilder::include_hierarchy(Module & module)
{
  const std::vector<Module *> hierarchy = hierarchy_(module);
  for (size_t i = 1; i < hierarchy.size(); ++i) {
    module.scope->include(hierarchy[i]->scope);
  }
}

}  // namespace scopelink
