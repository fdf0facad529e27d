// scopelink/model/model_context.cpp - ModelContext out-of-line members
//
#include "scopelink/model/model_context.hpp"

#include "scopelink/link/scope.hpp"

namespace scopelink
{

ModelContext::ModelContext(IdGenerator ids, size_t initialBufferSize)
: arena_(initialBufferSize), stringPool_(&arena_), ids_(std::move(ids))
{
}

// Defined here so that std::unique_ptr<Scope> sees the complete type.
ModelContext::~ModelContext() = default;

Scope * ModelContext::create_scope(Scope * container)
{
  scopes_.push_back(std::make_unique<Scope>(container));
  return scopes_.back().get();
}

void ModelContext::cache_node(Node * node)
{
  if (node == nullptr || !node->id.is_valid()) {
    return;
  }
  nodeCache_.insert_or_assign(node->id, node);
}

Node * ModelContext::node_by_id(NodeId id) const
{
  auto it = nodeCache_.find(id);
  return it != nodeCache_.end() ? it->second : nullptr;
}

}  // namespace scopelink
