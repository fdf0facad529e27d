// scopelink/link/identity_assigner.cpp - Fresh identities and back references
//
#include "scopelink/link/identity_assigner.hpp"

#include "scopelink/model/node_cloner.hpp"
#include "scopelink/model/traversal.hpp"

namespace scopelink
{

Environment * IdentityAssigner::assign(const Environment & merged)
{
  NodeCloner cloner(target_);
  Environment * root = cloner.clone_as(&merged);
  stamp_back_references(*root);
  return root;
}

void IdentityAssigner::stamp_back_references(Environment & root)
{
  target_.clear_node_cache();
  walk_preorder(static_cast<Node *>(&root), [this, &root](Node * node, Node * parent) {
    target_.cache_node(node);
    node->environment = &root;
    if (parent != nullptr) {
      node->parent = parent;
    }
  });
}

}  // namespace scopelink
