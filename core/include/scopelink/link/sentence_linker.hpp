// scopelink/link/sentence_linker.hpp - Attaching a sentence to a linked node
//
#pragma once

#include "scopelink/model/model.hpp"

namespace scopelink
{

/**
 * Link one freshly parsed sentence into an already linked `context` node.
 *
 * The sentence's own contribution (if any) is registered into the context's
 * scope. Every node of the sentence, in pre-order, then gets a fresh id from
 * the Environment's context, a new scope chained to the previous node's scope
 * (the first one to the context's scope) holding its own contribution, the
 * context's Environment, and its parent (the context for the sentence itself).
 * The nodes are recorded in the Environment's id cache.
 *
 * The sentence must be allocated in the Environment's ModelContext.
 *
 * @return false, changing nothing, if `context` is not linked or `sentence`
 *         is not a sentence
 */
bool attach_sentence(Node & sentence, Node & context);

}  // namespace scopelink
