// scopelink/model/model.hpp - Model node class definitions
//
// Nodes follow the LLVM/Clang style: a NodeKind tag plus classof() for RTTI,
// arena allocation through ModelContext, and non-owning pointers everywhere.
//
#pragma once

#include <gsl/span>
#include <string_view>
#include <utility>

#include "scopelink/basic/casting.hpp"
#include "scopelink/basic/diagnostic.hpp"
#include "scopelink/basic/id_generator.hpp"
#include "scopelink/model/model_enums.hpp"

namespace scopelink
{

class Scope;
class Environment;
class ModelContext;

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all model nodes.
 *
 * The link-time fields (id, scope, parent, environment) are empty on freshly
 * parsed trees and are stamped by the linker.
 *
 * Nodes are non-copyable and managed by ModelContext.
 */
class Node
{
public:
  const NodeKind kind;

  NodeId id;

  /// Lookup structure built for this node (owned by the Environment's ModelContext)
  Scope * scope = nullptr;

  /// Syntactic parent, nullptr for the Environment root
  Node * parent = nullptr;

  /// Root of the linked tree this node belongs to
  Environment * environment = nullptr;

  Node(const Node &) = delete;
  Node & operator=(const Node &) = delete;
  Node(Node &&) = delete;
  Node & operator=(Node &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }

  [[nodiscard]] bool is_linked() const noexcept { return environment != nullptr && scope != nullptr; }

  static bool classof(const Node *) { return true; }

protected:
  explicit Node(NodeKind k) : kind(k) {}
  ~Node() = default;  // Non-virtual, protected: prevents polymorphic delete
};

/**
 * CRTP base class that implements classof() for a concrete kind.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind_value = K;

  static bool classof(const Node * node) { return node->get_kind() == K; }

protected:
  template <typename... Args>
  explicit NodeBase(Args &&... args) : Base(K, std::forward<Args>(args)...)
  {
  }
};

// ============================================================================
// Category Base Classes
// ============================================================================

/**
 * A named declaration that other nodes may refer to.
 * The name may be empty (anonymous singletons, unnamed tests).
 */
class Entity : public Node
{
public:
  std::string_view name;

  static bool classof(const Node * node) { return is_entity_kind(node->kind); }

protected:
  Entity(NodeKind k, std::string_view n) : Node(k), name(n) {}
};

class Expr : public Node
{
public:
  static bool classof(const Node * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k) : Node(k) {}
};

class ParameterizedType;

/**
 * Class-like entity: owns members and declares supertypes.
 *
 * The linearized hierarchy is not stored here; it is supplied to the linker by a
 * HierarchyProvider.
 */
class Module : public Entity
{
public:
  gsl::span<ParameterizedType *> supertypes;
  gsl::span<Node *> members;  ///< Field, Method, Test or Variable

  static bool classof(const Node * node) { return is_module_kind(node->kind); }

protected:
  Module(NodeKind k, std::string_view n) : Entity(k, n) {}
};

// ============================================================================
// Problems
// ============================================================================

/**
 * Diagnostic value recorded on a Package by the parser.
 * Arena resident, so it only holds views.
 */
struct Problem
{
  std::string_view code;
  Severity level = Severity::Error;
  gsl::span<std::string_view> values;
};

// ============================================================================
// Supporting Nodes
// ============================================================================

class Body;
class Reference;

/// Type application: the supertype or instantiated class of a declaration.
class ParameterizedType
: public NodeBase<ParameterizedType, Node, NodeKind::ParameterizedType>
{
public:
  Reference * reference;

  explicit ParameterizedType(Reference * ref) : NodeBase(), reference(ref) {}
};

class Import : public NodeBase<Import, Node, NodeKind::Import>
{
public:
  Reference * entity;
  bool isGeneric = false;  ///< `import p.*` rather than `import p.A`

  Import(Reference * e, bool generic) : NodeBase(), entity(e), isGeneric(generic) {}
};

class Field : public NodeBase<Field, Node, NodeKind::Field>
{
public:
  std::string_view name;
  bool isConstant = false;
  Expr * value = nullptr;

  Field(std::string_view n, bool constant, Expr * v = nullptr)
  : NodeBase(), name(n), isConstant(constant), value(v)
  {
  }
};

class Parameter : public NodeBase<Parameter, Node, NodeKind::Parameter>
{
public:
  std::string_view name;
  bool isVarArg = false;

  explicit Parameter(std::string_view n, bool var_arg = false)
  : NodeBase(), name(n), isVarArg(var_arg)
  {
  }
};

class Method : public NodeBase<Method, Node, NodeKind::Method>
{
public:
  std::string_view name;
  gsl::span<Parameter *> parameters;
  Body * body = nullptr;  ///< nullptr for abstract methods

  explicit Method(std::string_view n) : NodeBase(), name(n) {}
};

class Body : public NodeBase<Body, Node, NodeKind::Body>
{
public:
  gsl::span<Node *> sentences;

  Body() : NodeBase() {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

/// Name use site. The name may be qualified ("p.A.x").
class Reference : public NodeBase<Reference, Expr, NodeKind::Reference>
{
public:
  std::string_view name;

  explicit Reference(std::string_view n) : NodeBase(), name(n) {}
};

class Self : public NodeBase<Self, Expr, NodeKind::Self>
{
public:
  Self() : NodeBase() {}
};

class Literal : public NodeBase<Literal, Expr, NodeKind::Literal>
{
public:
  LiteralKind literalKind;
  std::string_view value;

  Literal(LiteralKind k, std::string_view v) : NodeBase(), literalKind(k), value(v) {}
};

/// Message send: receiver.message(args)
class Send : public NodeBase<Send, Expr, NodeKind::Send>
{
public:
  Expr * receiver;
  std::string_view message;
  gsl::span<Expr *> args;

  Send(Expr * r, std::string_view m) : NodeBase(), receiver(r), message(m) {}
};

class New : public NodeBase<New, Expr, NodeKind::New>
{
public:
  ParameterizedType * instantiated;
  gsl::span<Expr *> args;

  explicit New(ParameterizedType * t) : NodeBase(), instantiated(t) {}
};

class If : public NodeBase<If, Expr, NodeKind::If>
{
public:
  Expr * condition;
  Body * thenBody;
  Body * elseBody = nullptr;

  If(Expr * c, Body * then_body, Body * else_body = nullptr)
  : NodeBase(), condition(c), thenBody(then_body), elseBody(else_body)
  {
  }
};

class Throw : public NodeBase<Throw, Expr, NodeKind::Throw>
{
public:
  Expr * exception;

  explicit Throw(Expr * e) : NodeBase(), exception(e) {}
};

// ============================================================================
// Sentence Nodes
// ============================================================================

class Return : public NodeBase<Return, Node, NodeKind::Return>
{
public:
  Expr * value = nullptr;

  explicit Return(Expr * v = nullptr) : NodeBase(), value(v) {}
};

class Assignment : public NodeBase<Assignment, Node, NodeKind::Assignment>
{
public:
  Reference * variable;
  Expr * value;

  Assignment(Reference * var, Expr * v) : NodeBase(), variable(var), value(v) {}
};

// ============================================================================
// Entity Nodes
// ============================================================================

class Package : public NodeBase<Package, Entity, NodeKind::Package>
{
public:
  std::string_view fileName;  ///< Source-file identifier, empty when unknown
  bool isTestFile = false;
  gsl::span<Import *> imports;
  gsl::span<Entity *> members;
  gsl::span<Problem> problems;

  explicit Package(std::string_view n, std::string_view file = {}, bool test_file = false)
  : NodeBase(n), fileName(file), isTestFile(test_file)
  {
  }
};

class Program : public NodeBase<Program, Entity, NodeKind::Program>
{
public:
  Body * body;

  Program(std::string_view n, Body * b) : NodeBase(n), body(b) {}
};

class Test : public NodeBase<Test, Entity, NodeKind::Test>
{
public:
  Body * body;

  Test(std::string_view n, Body * b) : NodeBase(n), body(b) {}
};

class Class : public NodeBase<Class, Module, NodeKind::Class>
{
public:
  explicit Class(std::string_view n) : NodeBase(n) {}
};

/// Named or anonymous object declaration.
class Singleton : public NodeBase<Singleton, Module, NodeKind::Singleton>
{
public:
  explicit Singleton(std::string_view n = {}) : NodeBase(n) {}
};

class Mixin : public NodeBase<Mixin, Module, NodeKind::Mixin>
{
public:
  explicit Mixin(std::string_view n) : NodeBase(n) {}
};

/// Test suite: a module whose members include tests.
class Describe : public NodeBase<Describe, Module, NodeKind::Describe>
{
public:
  explicit Describe(std::string_view n) : NodeBase(n) {}
};

class Variable : public NodeBase<Variable, Entity, NodeKind::Variable>
{
public:
  bool isConstant = false;
  Expr * value = nullptr;

  Variable(std::string_view n, bool constant, Expr * v = nullptr)
  : NodeBase(n), isConstant(constant), value(v)
  {
  }
};

// ============================================================================
// Environment (Root Node)
// ============================================================================

class Environment : public NodeBase<Environment, Node, NodeKind::Environment>
{
public:
  gsl::span<Package *> members;

  /// Context owning every node, scope and interned name of this environment
  ModelContext * context = nullptr;

  Environment() : NodeBase() {}
};

// ============================================================================
// Helper Functions
// ============================================================================

/// Entities, fields and parameters can be the target of a name.
[[nodiscard]] inline bool can_be_referenced(const Node * node) noexcept
{
  return isa<Entity>(node) || isa<Field>(node) || isa<Parameter>(node);
}

/**
 * Name a node contributes to its enclosing scope, or an empty view when it
 * contributes nothing (not referenceable, or anonymous).
 */
[[nodiscard]] inline std::string_view contributed_name(const Node * node) noexcept
{
  if (const auto * entity = dyn_cast<Entity>(node)) return entity->name;
  if (const auto * field = dyn_cast<Field>(node)) return field->name;
  if (const auto * param = dyn_cast<Parameter>(node)) return param->name;
  return {};
}

[[nodiscard]] inline bool is_sentence(const Node * node) noexcept
{
  return node != nullptr && is_sentence_kind(node->kind);
}

}  // namespace scopelink
