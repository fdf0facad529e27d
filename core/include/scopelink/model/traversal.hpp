// scopelink/model/traversal.hpp - Ordered child iteration and pre-order walks
//
// Children are visited in declaration order, which is the order every linker
// pass relies on (imports before members, supertypes before members, ...).
//
#pragma once

#include <cstddef>
#include <type_traits>
#include <utility>
#include <vector>

#include "scopelink/basic/casting.hpp"
#include "scopelink/model/model.hpp"

namespace scopelink
{

namespace detail
{

template <typename NodeT, typename Fn, typename Child>
void visit_child(Fn & fn, Child * child)
{
  if (child != nullptr) {
    fn(static_cast<NodeT *>(child));
  }
}

template <typename NodeT, typename Fn, typename Child>
void visit_children(Fn & fn, gsl::span<Child *> children)
{
  for (Child * child : children) {
    visit_child<NodeT>(fn, child);
  }
}

template <typename NodeT, typename Fn>
void for_each_child_impl(NodeT * node, Fn & fn)
{
  static_assert(std::is_same_v<std::remove_const_t<NodeT>, Node>, "NodeT must be Node");
  if (node == nullptr) {
    return;
  }

  switch (node->kind) {
    case NodeKind::Environment:
      detail::visit_children<NodeT>(fn, cast<Environment>(node)->members);
      return;
    case NodeKind::Package: {
      const auto * pkg = cast<Package>(node);
      detail::visit_children<NodeT>(fn, pkg->imports);
      detail::visit_children<NodeT>(fn, pkg->members);
      return;
    }
    case NodeKind::Program:
      detail::visit_child<NodeT>(fn, cast<Program>(node)->body);
      return;
    case NodeKind::Test:
      detail::visit_child<NodeT>(fn, cast<Test>(node)->body);
      return;
    case NodeKind::Class:
    case NodeKind::Singleton:
    case NodeKind::Mixin:
    case NodeKind::Describe: {
      const auto * mod = cast<Module>(node);
      detail::visit_children<NodeT>(fn, mod->supertypes);
      detail::visit_children<NodeT>(fn, mod->members);
      return;
    }
    case NodeKind::Variable:
      detail::visit_child<NodeT>(fn, cast<Variable>(node)->value);
      return;
    case NodeKind::Return:
      detail::visit_child<NodeT>(fn, cast<Return>(node)->value);
      return;
    case NodeKind::Assignment: {
      const auto * assignment = cast<Assignment>(node);
      detail::visit_child<NodeT>(fn, assignment->variable);
      detail::visit_child<NodeT>(fn, assignment->value);
      return;
    }
    case NodeKind::Reference:
    case NodeKind::Self:
    case NodeKind::Literal:
    case NodeKind::Parameter:
      return;
    case NodeKind::Send: {
      const auto * send = cast<Send>(node);
      detail::visit_child<NodeT>(fn, send->receiver);
      detail::visit_children<NodeT>(fn, send->args);
      return;
    }
    case NodeKind::New: {
      const auto * instantiation = cast<New>(node);
      detail::visit_child<NodeT>(fn, instantiation->instantiated);
      detail::visit_children<NodeT>(fn, instantiation->args);
      return;
    }
    case NodeKind::If: {
      const auto * conditional = cast<If>(node);
      detail::visit_child<NodeT>(fn, conditional->condition);
      detail::visit_child<NodeT>(fn, conditional->thenBody);
      detail::visit_child<NodeT>(fn, conditional->elseBody);
      return;
    }
    case NodeKind::Throw:
      detail::visit_child<NodeT>(fn, cast<Throw>(node)->exception);
      return;
    case NodeKind::Field:
      detail::visit_child<NodeT>(fn, cast<Field>(node)->value);
      return;
    case NodeKind::Method: {
      const auto * method = cast<Method>(node);
      detail::visit_children<NodeT>(fn, method->parameters);
      detail::visit_child<NodeT>(fn, method->body);
      return;
    }
    case NodeKind::Import:
      detail::visit_child<NodeT>(fn, cast<Import>(node)->entity);
      return;
    case NodeKind::Body:
      detail::visit_children<NodeT>(fn, cast<Body>(node)->sentences);
      return;
    case NodeKind::ParameterizedType:
      detail::visit_child<NodeT>(fn, cast<ParameterizedType>(node)->reference);
      return;
  }
}

template <typename NodeT, typename Fn>
void walk_preorder_impl(NodeT * root, Fn & fn)
{
  if (root == nullptr) {
    return;
  }

  std::vector<std::pair<NodeT *, NodeT *>> stack;
  stack.emplace_back(root, nullptr);

  std::vector<NodeT *> children;
  while (!stack.empty()) {
    auto [node, parent] = stack.back();
    stack.pop_back();

    fn(node, parent);

    children.clear();
    auto collect = [&children](NodeT * child) { children.push_back(child); };
    for_each_child_impl(node, collect);
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
      stack.emplace_back(*it, node);
    }
  }
}

}  // namespace detail

/**
 * Call `fn(child)` for each direct child of `node`, in declaration order.
 * Null children (absent optional parts) are skipped.
 */
template <typename Fn>
void for_each_child(Node * node, Fn && fn)
{
  detail::for_each_child_impl(node, fn);
}

template <typename Fn>
void for_each_child(const Node * node, Fn && fn)
{
  detail::for_each_child_impl(node, fn);
}

/// Direct children of `node`, in declaration order.
[[nodiscard]] inline std::vector<Node *> children_of(Node * node)
{
  std::vector<Node *> children;
  for_each_child(node, [&children](Node * child) { children.push_back(child); });
  return children;
}

/**
 * Pre-order walk of the subtree rooted at `root`, root included.
 *
 * `fn(node, parent)` receives the parent found during this walk (nullptr for the
 * root), which does not depend on the nodes' stored parent pointers. The walk uses
 * an explicit stack, so deep trees do not exhaust the call stack.
 */
template <typename Fn>
void walk_preorder(Node * root, Fn && fn)
{
  detail::walk_preorder_impl(root, fn);
}

template <typename Fn>
void walk_preorder(const Node * root, Fn && fn)
{
  detail::walk_preorder_impl(root, fn);
}

/// Number of nodes in the subtree rooted at `root`.
[[nodiscard]] inline size_t count_nodes(const Node * root)
{
  size_t count = 0;
  walk_preorder(root, [&count](const Node *, const Node *) { ++count; });
  return count;
}

}  // namespace scopelink
