// scopelink/link/scope.hpp - Name contributions and qualified-name resolution
//
// Every linked node owns one Scope. A Scope maps names to the nodes that
// contribute them, consults an ordered list of included scopes in a single
// non-transitive hop, and falls back to its lexically enclosing container.
//
#pragma once

#include <cstddef>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "scopelink/basic/casting.hpp"
#include "scopelink/model/model.hpp"

namespace scopelink
{

// ============================================================================
// Transparent Hash/Equal for string_view keys
// ============================================================================

/// Transparent hash functor for string_view heterogeneous lookup
struct StringViewHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

/// Transparent equality functor for string_view heterogeneous lookup
struct StringViewEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

// ============================================================================
// Scope
// ============================================================================

/// A (name, node) pair contributed to a scope.
using Contribution = std::pair<std::string_view, Node *>;

/**
 * Lookup structure attached to a linked node.
 *
 * Names (keys) must outlive the scope; the linker only registers names that are
 * interned in the Environment's ModelContext. Container and included scopes are
 * non-owning and are owned by the same ModelContext.
 */
class Scope
{
public:
  /// Create a scope with an optional lexically enclosing container
  explicit Scope(Scope * container = nullptr) : container_(container) {}

  Scope(const Scope &) = delete;
  Scope & operator=(const Scope &) = delete;

  // ===========================================================================
  // Registration
  // ===========================================================================

  /**
   * Register `node` under `name`.
   *
   * A free name is always taken. A taken name is only replaced when the
   * existing entry is a test-file Package and `node` is a non-test Package;
   * otherwise the first registration wins.
   *
   * @return true if `node` is now the entry for `name`
   */
  bool register_contribution(std::string_view name, Node * node);

  /**
   * Register the contribution of `node` (its name, when it is referenceable and
   * named). Does nothing for other nodes.
   */
  bool register_node(Node * node);

  /// Register every contribution in order.
  void register_all(const std::vector<Contribution> & contributions);

  /// Append a scope consulted (one hop, no lookup) after local contributions.
  void include(Scope * other);

  // ===========================================================================
  // Lookup
  // ===========================================================================

  /**
   * Resolve a possibly qualified name ("p.A.x").
   *
   * The first segment is looked up in the local contributions, then (when
   * `allow_lookup`) in each included scope without lookup, then in the
   * container with lookup. A remaining suffix is resolved in the found node's
   * own scope without lookup.
   *
   * @return The node, or nullptr when the name does not resolve
   */
  [[nodiscard]] Node * resolve(std::string_view qualified_name, bool allow_lookup = true) const;

  /**
   * Resolve and narrow to T.
   *
   * @return nullptr when the name does not resolve or resolves to another kind
   */
  template <typename T>
  [[nodiscard]] T * resolve_as(std::string_view qualified_name, bool allow_lookup = true) const
  {
    return dyn_cast<T>(resolve(qualified_name, allow_lookup));
  }

  /// Look up a single name in the local contributions only.
  [[nodiscard]] Node * lookup_local(std::string_view name) const;

  // ===========================================================================
  // Scope Properties
  // ===========================================================================

  /// Local contributions in registration order.
  [[nodiscard]] std::vector<Contribution> local_contributions() const;

  [[nodiscard]] Scope * container() const noexcept { return container_; }

  [[nodiscard]] const std::vector<Scope *> & included() const noexcept { return included_; }

  [[nodiscard]] bool contains(std::string_view name) const { return lookup_local(name) != nullptr; }

  [[nodiscard]] size_t size() const noexcept { return contributions_.size(); }

  [[nodiscard]] bool empty() const noexcept { return contributions_.empty(); }

private:
  Scope * container_;
  std::unordered_map<std::string_view, Node *, StringViewHash, StringViewEqual> contributions_;
  std::vector<std::string_view> order_;
  std::vector<Scope *> included_;
};

}  // namespace scopelink
