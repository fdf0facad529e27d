// scopelink/link/package_merger.cpp - Package merge implementation
//
#include "scopelink/link/package_merger.hpp"

#include <algorithm>
#include <utility>

#include "scopelink/basic/casting.hpp"
#include "scopelink/model/node_cloner.hpp"

namespace scopelink
{

std::vector<Entity *> PackageMerger::merge(std::vector<Entity *> members, Entity * incoming)
{
  if (incoming == nullptr) {
    return members;
  }

  auto * incoming_pkg = dyn_cast<Package>(incoming);
  if (incoming_pkg == nullptr) {
    members.erase(
      std::remove_if(
        members.begin(), members.end(),
        [incoming](const Entity * member) { return member->name == incoming->name; }),
      members.end());
    members.push_back(incoming);
    return members;
  }

  auto match = std::find_if(members.begin(), members.end(), [incoming_pkg](Entity * member) {
    const auto * pkg = dyn_cast<Package>(member);
    return pkg != nullptr && pkg->name == incoming_pkg->name &&
           pkg->fileName == incoming_pkg->fileName;
  });

  if (match == members.end()) {
    members.push_back(incoming_pkg);
    return members;
  }

  const auto * existing = cast<Package>(*match);
  members.erase(match);

  std::vector<Entity *> sub_packages;
  for (Entity * member : existing->members) {
    if (isa<Package>(member)) {
      sub_packages.push_back(member);
    }
  }
  for (Entity * member : incoming_pkg->members) {
    if (isa<Package>(member)) {
      sub_packages = merge(std::move(sub_packages), member);
    }
  }
  for (Entity * member : incoming_pkg->members) {
    if (!isa<Package>(member)) {
      sub_packages.push_back(member);
    }
  }

  PackageOverrides overrides;
  overrides.members = std::move(sub_packages);
  overrides.imports = incoming_pkg->imports;
  overrides.problems = incoming_pkg->problems;
  members.push_back(copy_package(scratch_, *existing, overrides));
  return members;
}

std::vector<Entity *> PackageMerger::merge_all(
  std::vector<Entity *> members, gsl::span<Package * const> incoming)
{
  for (Package * pkg : incoming) {
    members = merge(std::move(members), pkg);
  }
  return members;
}

}  // namespace scopelink
