// scopelink/link/hierarchy.cpp - Default supertype linearization
//
#include "scopelink/link/hierarchy.hpp"

#include <algorithm>

#include "scopelink/basic/casting.hpp"
#include "scopelink/link/scope.hpp"

namespace scopelink
{

namespace
{

Module * resolve_supertype(const ParameterizedType * type)
{
  if (type == nullptr || type->reference == nullptr) {
    return nullptr;
  }
  const Reference * ref = type->reference;
  if (ref->scope == nullptr) {
    return nullptr;
  }
  return ref->scope->resolve_as<Module>(ref->name);
}

bool contains(const std::vector<Module *> & modules, const Module * module)
{
  return std::find(modules.begin(), modules.end(), module) != modules.end();
}

std::vector<Module *> hierarchy_excluding(Module * module, std::vector<Module *> exclude)
{
  if (contains(exclude, module)) {
    return {};
  }

  std::vector<Module *> result{module};
  exclude.push_back(module);

  for (const ParameterizedType * supertype : module->supertypes) {
    Module * target = resolve_supertype(supertype);
    if (target == nullptr) {
      continue;
    }
    std::vector<Module *> inherited = hierarchy_excluding(target, exclude);
    for (Module * m : inherited) {
      result.push_back(m);
      exclude.push_back(m);
    }
  }
  return result;
}

}  // namespace

std::vector<Module *> supertype_hierarchy(Module & module)
{
  return hierarchy_excluding(&module, {});
}

}  // namespace scopelink
