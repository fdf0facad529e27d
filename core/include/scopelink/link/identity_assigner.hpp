// scopelink/link/identity_assigner.hpp - Fresh identities and back references
//
#pragma once

#include "scopelink/model/model.hpp"
#include "scopelink/model/model_context.hpp"

namespace scopelink
{

/**
 * Rebuilds a merged Environment inside the context that will own the linked
 * result.
 *
 * Every node, the root included, is copied and stamped with a fresh id from
 * the target context. The copy is then walked in pre-order to fill the
 * id -> node cache and to set each node's environment and parent.
 */
class IdentityAssigner
{
public:
  explicit IdentityAssigner(ModelContext & target) : target_(target) {}

  /**
   * Copy `merged` into the target context and stamp it.
   *
   * @return The new root, owned by the target context
   */
  [[nodiscard]] Environment * assign(const Environment & merged);

  /**
   * Set environment and parent back references of every node under `root`,
   * and record each node in the target's id cache.
   */
  void stamp_back_references(Environment & root);

private:
  ModelContext & target_;
};

}  // namespace scopelink
