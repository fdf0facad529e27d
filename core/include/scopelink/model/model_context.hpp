// scopelink/model/model_context.hpp - Arena owning a model tree and its scopes
//
// A ModelContext owns:
// - every node allocated through create<T>() (PMR monotonic arena)
// - interned names
// - the Scope built for each node, and the auxiliary scopes made for imports
// - the identity generator and the id -> node cache of a linked Environment
//
#pragma once

#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "scopelink/basic/id_generator.hpp"
#include "scopelink/model/model.hpp"

namespace scopelink
{

class ModelContext
{
public:
  static constexpr size_t k_default_buffer_size = size_t{64} * size_t{1024};

  explicit ModelContext(
    IdGenerator ids = IdGenerator{}, size_t initialBufferSize = k_default_buffer_size);

  ~ModelContext();

  // Non-copyable and non-movable (PMR resources are not movable)
  ModelContext(const ModelContext &) = delete;
  ModelContext & operator=(const ModelContext &) = delete;
  ModelContext(ModelContext &&) = delete;
  ModelContext & operator=(ModelContext &&) = delete;

  // ===========================================================================
  // Node Creation
  // ===========================================================================

  /**
   * Create a new node of type T in the arena.
   *
   * The node is valid until the context is destroyed.
   *
   * Example:
   *   auto * pkg = ctx.create<Package>(ctx.intern("p"), ctx.intern("p.src"));
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<Node, T>, "T must derive from Node");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "Model node must be trivially destructible to be managed by the arena! "
      "Use std::string_view instead of std::string, gsl::span instead of std::vector.");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  // ===========================================================================
  // String Interning
  // ===========================================================================

  /**
   * Intern a string and return a view that lives as long as the context.
   */
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    auto it = stringPool_.find(s);
    if (it != stringPool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size() == 0 ? 1 : s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());

    const std::string_view stored_view(ptr, s.size());
    stringPool_.insert(stored_view);
    return stored_view;
  }

  [[nodiscard]] bool is_interned(std::string_view s) const
  {
    return stringPool_.find(s) != stringPool_.end();
  }

  // ===========================================================================
  // Array Allocation
  // ===========================================================================

  /// Allocate a value-initialized array from the arena.
  template <typename T>
  [[nodiscard]] gsl::span<T> allocate_array(size_t size)
  {
    if (size == 0) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * size, alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_value_construct_n(ptr, size);
    return gsl::span<T>(ptr, size);
  }

  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    auto span = allocate_array<T>(vec.size());
    std::uninitialized_copy(vec.begin(), vec.end(), span.begin());
    return span;
  }

  // ===========================================================================
  // Scopes
  // ===========================================================================

  /**
   * Create a scope owned by this context.
   *
   * @param container Lexically enclosing scope, or nullptr
   */
  [[nodiscard]] Scope * create_scope(Scope * container = nullptr);

  [[nodiscard]] size_t scope_count() const noexcept { return scopes_.size(); }

  // ===========================================================================
  // Identities
  // ===========================================================================

  [[nodiscard]] NodeId next_id() { return ids_.next(); }

  [[nodiscard]] const IdGenerator & ids() const noexcept { return ids_; }

  /// Record a node under its current id (replacing any previous entry for it).
  void cache_node(Node * node);

  void clear_node_cache() { nodeCache_.clear(); }

  /// Node stamped with `id`, or nullptr.
  [[nodiscard]] Node * node_by_id(NodeId id) const;

  [[nodiscard]] size_t cached_node_count() const noexcept { return nodeCache_.size(); }

  [[nodiscard]] size_t get_string_count() const noexcept { return stringPool_.size(); }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> stringPool_;

  std::vector<std::unique_ptr<Scope>> scopes_;
  std::unordered_map<NodeId, Node *, NodeIdHash> nodeCache_;
  IdGenerator ids_;
};

}  // namespace scopelink
