// scopelink/model/visitor.hpp - CRTP visitor over model nodes
//
// Dispatch is generated from model_nodes.def, so adding a node kind only
// requires a new entry there plus the handlers that care about it.
//
#pragma once

#include <type_traits>

#include "scopelink/basic/casting.hpp"
#include "scopelink/model/model.hpp"
#include "scopelink/model/model_enums.hpp"

namespace scopelink
{

namespace detail
{

/// Propagate const from NodePtrT to derived node types
template <typename NodePtrT, typename DerivedNode>
struct PropagateConst
{
  using type = std::conditional_t<
    std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;
};

template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = typename PropagateConst<NodePtrT, DerivedNode>::type;

}  // namespace detail

/**
 * CRTP-based visitor for model nodes.
 *
 * The derived class implements visit_<snake>() for the kinds it handles. The
 * defaults fall back to the category handlers (visit_entity, visit_sentence,
 * visit_expr) and finally to visit_node.
 *
 * @code
 *   class NameCollector : public ConstModelVisitor<NameCollector> {
 *   public:
 *     void visit_class(const Class * node) { names.push_back(node->name); }
 *     std::vector<std::string_view> names;
 *   };
 * @endcode
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods (default: void)
 * @tparam NodePtrT Node * for mutating traversal, const Node * for read-only
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = Node *>
class ModelVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define SCOPELINK_NODE_DISPATCH(Class, Kind, Snake) \
  case NodeKind::Kind:                              \
    return get_derived().visit_##Snake(cast<Class>(node));
#define SCOPELINK_NODE_ENTITY SCOPELINK_NODE_DISPATCH
#define SCOPELINK_NODE_SENTENCE SCOPELINK_NODE_DISPATCH
#define SCOPELINK_NODE_EXPR SCOPELINK_NODE_DISPATCH
#define SCOPELINK_NODE_SUPPORT SCOPELINK_NODE_DISPATCH
#define SCOPELINK_NODE_TOP SCOPELINK_NODE_DISPATCH
#include "scopelink/model/model_nodes.def"
#undef SCOPELINK_NODE_DISPATCH
    }

    return ReturnType();
  }

  // Entities - default implementation calls visit_entity
#define SCOPELINK_NODE_ENTITY(Class, Kind, Snake)                           \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_entity(node);                                \
  }
#include "scopelink/model/model_nodes.def"

  // Non-expression sentences - default implementation calls visit_sentence
#define SCOPELINK_NODE_SENTENCE(Class, Kind, Snake)                         \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_sentence(node);                              \
  }
#include "scopelink/model/model_nodes.def"

  // Expressions - default implementation calls visit_expr
#define SCOPELINK_NODE_EXPR(Class, Kind, Snake)                             \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#include "scopelink/model/model_nodes.def"

  // Supporting and top-level nodes - default implementation calls visit_node
#define SCOPELINK_NODE_SUPPORT(Class, Kind, Snake)                          \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "scopelink/model/model_nodes.def"

#define SCOPELINK_NODE_TOP(Class, Kind, Snake)                              \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "scopelink/model/model_nodes.def"

  // ===========================================================================
  // Category-level visit methods
  // ===========================================================================

  ReturnType visit_entity(detail::propagate_const_t<NodePtrT, Entity> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_sentence(NodePtrT node) { return get_derived().visit_node(node); }

  /// Base case - does nothing by default
  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

/// Alias for read-only traversal
template <typename Derived, typename ReturnType = void>
using ConstModelVisitor = ModelVisitor<Derived, ReturnType, const Node *>;

}  // namespace scopelink
