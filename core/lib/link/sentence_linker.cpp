// scopelink/link/sentence_linker.cpp - Attaching a sentence to a linked node
//
#include "scopelink/link/sentence_linker.hpp"

#include "scopelink/link/scope.hpp"
#include "scopelink/model/model_context.hpp"
#include "scopelink/model/traversal.hpp"

namespace scopelink
{

bool attach_sentence(Node & sentence, Node & context)
{
  if (!context.is_linked() || !is_sentence(&sentence)) {
    return false;
  }
  Environment * env = context.environment;
  ModelContext * ctx = env->context;
  if (ctx == nullptr) {
    return false;
  }

  context.scope->register_node(&sentence);

  Scope * running = context.scope;
  walk_preorder(&sentence, [&](Node * node, Node * parent) {
    Scope * local = ctx->create_scope(running);
    local->register_node(node);

    node->id = ctx->next_id();
    node->scope = local;
    node->environment = env;
    node->parent = parent != nullptr ? parent : &context;
    ctx->cache_node(node);

    running = local;
  });
  return true;
}

}  // namespace scopelink
