// scopelink/model/qualified_name.cpp - Naming nodes by their enclosing entities
//
#include "scopelink/model/qualified_name.hpp"

#include <string_view>
#include <vector>

#include "scopelink/basic/casting.hpp"

namespace scopelink
{

std::string qualified_name(const Node * node)
{
  std::vector<std::string_view> segments;
  for (const Node * current = node; current != nullptr; current = current->parent) {
    const auto * entity = dyn_cast<Entity>(current);
    if (entity != nullptr && !entity->name.empty()) {
      segments.push_back(entity->name);
    }
  }

  std::string result;
  for (auto it = segments.rbegin(); it != segments.rend(); ++it) {
    if (!result.empty()) {
      result += '.';
    }
    result += *it;
  }
  return result;
}

const Package * enclosing_package(const Node * node)
{
  for (const Node * current = node; current != nullptr; current = current->parent) {
    if (const auto * pkg = dyn_cast<Package>(current)) {
      return pkg;
    }
  }
  return nullptr;
}

}  // namespace scopelink
