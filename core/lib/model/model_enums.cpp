// scopelink/model/model_enums.cpp - Kind names
//
#include "scopelink/model/model_enums.hpp"

namespace scopelink
{

std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define SCOPELINK_NODE_KIND_NAME(Class, Kind, Snake) \
  case NodeKind::Kind:                               \
    return #Class;
#define SCOPELINK_NODE_ENTITY SCOPELINK_NODE_KIND_NAME
#define SCOPELINK_NODE_SENTENCE SCOPELINK_NODE_KIND_NAME
#define SCOPELINK_NODE_EXPR SCOPELINK_NODE_KIND_NAME
#define SCOPELINK_NODE_SUPPORT SCOPELINK_NODE_KIND_NAME
#define SCOPELINK_NODE_TOP SCOPELINK_NODE_KIND_NAME
#include "scopelink/model/model_nodes.def"
#undef SCOPELINK_NODE_KIND_NAME
  }
  return "<unknown>";
}

std::optional<NodeKind> parse_node_kind(std::string_view name) noexcept
{
#define SCOPELINK_NODE_KIND_PARSE(Class, Kind, Snake) \
  if (name == #Class) return NodeKind::Kind;
#define SCOPELINK_NODE_ENTITY SCOPELINK_NODE_KIND_PARSE
#define SCOPELINK_NODE_SENTENCE SCOPELINK_NODE_KIND_PARSE
#define SCOPELINK_NODE_EXPR SCOPELINK_NODE_KIND_PARSE
#define SCOPELINK_NODE_SUPPORT SCOPELINK_NODE_KIND_PARSE
#define SCOPELINK_NODE_TOP SCOPELINK_NODE_KIND_PARSE
#include "scopelink/model/model_nodes.def"
#undef SCOPELINK_NODE_KIND_PARSE
  return std::nullopt;
}

std::string_view to_string(LiteralKind kind) noexcept
{
  switch (kind) {
    case LiteralKind::Null:
      return "null";
    case LiteralKind::Boolean:
      return "boolean";
    case LiteralKind::Number:
      return "number";
    case LiteralKind::String:
      return "string";
  }
  return "null";
}

std::optional<LiteralKind> parse_literal_kind(std::string_view name) noexcept
{
  if (name == "null") return LiteralKind::Null;
  if (name == "boolean") return LiteralKind::Boolean;
  if (name == "number") return LiteralKind::Number;
  if (name == "string") return LiteralKind::String;
  return std::nullopt;
}

}  // namespace scopelink
