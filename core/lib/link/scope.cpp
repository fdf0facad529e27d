// scopelink/link/scope.cpp - Scope implementation
//
#include "scopelink/link/scope.hpp"

namespace scopelink
{

namespace
{

/// A test-file package yields its name to a regular package of the same name.
bool should_be_overridden(const Node * older, const Node * newer)
{
  const auto * older_pkg = dyn_cast<Package>(older);
  const auto * newer_pkg = dyn_cast<Package>(newer);
  return older_pkg != nullptr && newer_pkg != nullptr && older_pkg->isTestFile &&
         !newer_pkg->isTestFile;
}

}  // namespace

bool Scope::register_contribution(std::string_view name, Node * node)
{
  if (node == nullptr) {
    return false;
  }

  auto it = contributions_.find(name);
  if (it == contributions_.end()) {
    contributions_.emplace(name, node);
    order_.push_back(name);
    return true;
  }

  if (should_be_overridden(it->second, node)) {
    it->second = node;
    return true;
  }
  return false;
}

bool Scope::register_node(Node * node)
{
  if (node == nullptr || !can_be_referenced(node)) {
    return false;
  }
  const std::string_view name = contributed_name(node);
  if (name.empty()) {
    return false;
  }
  return register_contribution(name, node);
}

void Scope::register_all(const std::vector<Contribution> & contributions)
{
  for (const auto & [name, node] : contributions) {
    register_contribution(name, node);
  }
}

void Scope::include(Scope * other)
{
  if (other != nullptr) {
    included_.push_back(other);
  }
}

Node * Scope::lookup_local(std::string_view name) const
{
  auto it = contributions_.find(name);
  return it != contributions_.end() ? it->second : nullptr;
}

Node * Scope::resolve(std::string_view qualified_name, bool allow_lookup) const
{
  const size_t dot = qualified_name.find('.');
  const std::string_view start = qualified_name.substr(0, dot);
  const std::string_view rest =
    dot == std::string_view::npos ? std::string_view{} : qualified_name.substr(dot + 1);

  Node * step = lookup_local(start);
  if (allow_lookup) {
    for (const Scope * other : included_) {
      if (step != nullptr) break;
      step = other->resolve(start, false);
    }
    if (step == nullptr && container_ != nullptr) {
      step = container_->resolve(start, true);
    }
  }

  if (rest.empty()) {
    return step;
  }
  if (step == nullptr || step->scope == nullptr) {
    return nullptr;
  }
  return step->scope->resolve(rest, false);
}

std::vector<Contribution> Scope::local_contributions() const
{
  std::vector<Contribution> result;
  result.reserve(order_.size());
  for (std::string_view name : order_) {
    result.emplace_back(name, contributions_.at(name));
  }
  return result;
}

}  // namespace scopelink
