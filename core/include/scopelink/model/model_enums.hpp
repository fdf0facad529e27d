// scopelink/model/model_enums.hpp - Model enumeration definitions
//
// Node kinds (generated from model_nodes.def), literal kinds and the kind-range
// predicates used by classof().
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace scopelink
{

// ============================================================================
// NodeKind - Identifies all model node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Kinds are grouped by category so that category tests are range checks.
 */
enum class NodeKind : uint8_t {
// === Entities ===
#define SCOPELINK_NODE_ENTITY(Class, Kind, Snake) Kind,
#include "scopelink/model/model_nodes.def"

// === Sentences ===
#define SCOPELINK_NODE_SENTENCE(Class, Kind, Snake) Kind,
#include "scopelink/model/model_nodes.def"

// === Expressions ===
#define SCOPELINK_NODE_EXPR(Class, Kind, Snake) Kind,
#include "scopelink/model/model_nodes.def"

// === Supporting nodes ===
#define SCOPELINK_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "scopelink/model/model_nodes.def"

// === Top-level ===
#define SCOPELINK_NODE_TOP(Class, Kind, Snake) Kind,
#include "scopelink/model/model_nodes.def"
};

/**
 * Literal value categories. The raw text of the literal is kept as written.
 */
enum class LiteralKind : uint8_t {
  Null,
  Boolean,
  Number,
  String,
};

// ============================================================================
// Node Categories
// ============================================================================

inline constexpr NodeKind k_first_entity_kind = NodeKind::Package;
inline constexpr NodeKind k_last_entity_kind = NodeKind::Variable;

inline constexpr NodeKind k_first_module_kind = NodeKind::Class;
inline constexpr NodeKind k_last_module_kind = NodeKind::Describe;

inline constexpr NodeKind k_first_sentence_kind = NodeKind::Variable;
inline constexpr NodeKind k_last_sentence_kind = NodeKind::Throw;

inline constexpr NodeKind k_first_expr_kind = NodeKind::Reference;
inline constexpr NodeKind k_last_expr_kind = NodeKind::Throw;

namespace detail
{
[[nodiscard]] constexpr bool kind_in(NodeKind kind, NodeKind first, NodeKind last) noexcept
{
  return static_cast<uint8_t>(kind) >= static_cast<uint8_t>(first) &&
         static_cast<uint8_t>(kind) <= static_cast<uint8_t>(last);
}
}  // namespace detail

[[nodiscard]] constexpr bool is_entity_kind(NodeKind kind) noexcept
{
  return detail::kind_in(kind, k_first_entity_kind, k_last_entity_kind);
}

[[nodiscard]] constexpr bool is_module_kind(NodeKind kind) noexcept
{
  return detail::kind_in(kind, k_first_module_kind, k_last_module_kind);
}

[[nodiscard]] constexpr bool is_sentence_kind(NodeKind kind) noexcept
{
  return detail::kind_in(kind, k_first_sentence_kind, k_last_sentence_kind);
}

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return detail::kind_in(kind, k_first_expr_kind, k_last_expr_kind);
}

// ============================================================================
// Names
// ============================================================================

/// Class name of a kind as used in JSON ("Package", "ParameterizedType", ...).
[[nodiscard]] std::string_view to_string(NodeKind kind) noexcept;

[[nodiscard]] std::optional<NodeKind> parse_node_kind(std::string_view name) noexcept;

[[nodiscard]] std::string_view to_string(LiteralKind kind) noexcept;

[[nodiscard]] std::optional<LiteralKind> parse_literal_kind(std::string_view name) noexcept;

}  // namespace scopelink
