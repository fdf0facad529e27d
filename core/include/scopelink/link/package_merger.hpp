// scopelink/link/package_merger.hpp - Folding new packages into existing members
//
#pragma once

#include <gsl/span>
#include <vector>

#include "scopelink/model/model.hpp"
#include "scopelink/model/model_context.hpp"

namespace scopelink
{

/**
 * Merges incoming top-level packages into an Environment's member list.
 *
 * Two packages are the same logical package when both their name and their
 * fileName match. Merged packages are shallow copies allocated in the scratch
 * context given at construction; inputs are never modified.
 */
class PackageMerger
{
public:
  explicit PackageMerger(ModelContext & scratch) : scratch_(scratch) {}

  /**
   * Merge one incoming entity into `members`.
   *
   * - A non-package entity replaces every member with its name and goes last.
   * - A package without a match is appended.
   * - A matching package is removed and a merged copy is appended. The copy
   *   keeps the match's sub-packages, merged recursively with the incoming
   *   ones, followed by the incoming non-package members. Imports and
   *   problems come from the incoming package.
   */
  [[nodiscard]] std::vector<Entity *> merge(std::vector<Entity *> members, Entity * incoming);

  /// Left fold of merge() over `incoming`.
  [[nodiscard]] std::vector<Entity *> merge_all(
    std::vector<Entity *> members, gsl::span<Package * const> incoming);

private:
  ModelContext & scratch_;
};

}  // namespace scopelink
