// scopelink/link/linker.cpp - Link pipeline
//
#include "scopelink/link/linker.hpp"

#include <utility>

#include "scopelink/basic/casting.hpp"
#include "scopelink/link/identity_assigner.hpp"
#include "scopelink/link/package_merger.hpp"
#include "scopelink/link/scope_builder.hpp"

namespace scopelink
{

namespace
{

/// First counter value that cannot collide with the base's identities.
uint64_t first_free_id(const Environment * base)
{
  if (base == nullptr || base->context == nullptr) {
    return 1;
  }
  return base->context->ids().high_water_mark() + 1;
}

}  // namespace

Linker::Linker(LinkOptions options, HierarchyProvider hierarchy)
: options_(std::move(options)), hierarchy_(std::move(hierarchy))
{
}

LinkedEnvironment Linker::link(gsl::span<Package * const> new_packages, const Environment * base) const
{
  // Merged packages are shallow copies; they only need to outlive the deep copy below.
  ModelContext scratch;

  std::vector<Entity *> members;
  if (base != nullptr) {
    members.assign(base->members.begin(), base->members.end());
  }
  PackageMerger merger(scratch);
  members = merger.merge_all(std::move(members), new_packages);

  auto * merged = scratch.create<Environment>();
  merged->members = scratch.allocate_array<Package *>(members.size());
  auto out = merged->members.begin();
  for (Entity * member : members) {
    *out = cast<Package>(member);
    ++out;
  }

  LinkedEnvironment result;
  result.context =
    std::make_unique<ModelContext>(IdGenerator(options_.id_strategy, first_free_id(base)));

  IdentityAssigner identities(*result.context);
  result.environment = identities.assign(*merged);

  ScopeBuilder scopes(*result.context, options_.global_packages, hierarchy_);
  scopes.build(*result.environment);

  return result;
}

LinkedEnvironment link(
  gsl::span<Package * const> new_packages, const Environment * base, const LinkOptions & options)
{
  return Linker(options).link(new_packages, base);
}

}  // namespace scopelink
