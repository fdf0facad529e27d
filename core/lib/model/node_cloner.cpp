// scopelink/model/node_cloner.cpp - Structural copies of model trees
//
#include "scopelink/model/node_cloner.hpp"

namespace scopelink
{

Node * NodeCloner::visit_environment(const Environment * node)
{
  auto * copy = stamp(target_.create<Environment>());
  copy->context = &target_;
  copy->members = clone_all(node->members);
  return copy;
}

Node * NodeCloner::visit_package(const Package * node)
{
  auto * copy = stamp(target_.create<Package>(
    target_.intern(node->name), target_.intern(node->fileName), node->isTestFile));
  copy->imports = clone_all(node->imports);
  copy->members = clone_all(node->members);
  copy->problems = clone_problems(node->problems);
  return copy;
}

Node * NodeCloner::visit_program(const Program * node)
{
  auto * copy = stamp(target_.create<Program>(target_.intern(node->name), nullptr));
  copy->body = clone_as(node->body);
  return copy;
}

Node * NodeCloner::visit_test(const Test * node)
{
  auto * copy = stamp(target_.create<Test>(target_.intern(node->name), nullptr));
  copy->body = clone_as(node->body);
  return copy;
}

void NodeCloner::clone_module_parts(const Module * source, Module * copy)
{
  copy->supertypes = clone_all(source->supertypes);
  copy->members = clone_all(source->members);
}

Node * NodeCloner::visit_class(const Class * node)
{
  auto * copy = stamp(target_.create<Class>(target_.intern(node->name)));
  clone_module_parts(node, copy);
  return copy;
}

Node * NodeCloner::visit_singleton(const Singleton * node)
{
  auto * copy = stamp(target_.create<Singleton>(target_.intern(node->name)));
  clone_module_parts(node, copy);
  return copy;
}

Node * NodeCloner::visit_mixin(const Mixin * node)
{
  auto * copy = stamp(target_.create<Mixin>(target_.intern(node->name)));
  clone_module_parts(node, copy);
  return copy;
}

Node * NodeCloner::visit_describe(const Describe * node)
{
  auto * copy = stamp(target_.create<Describe>(target_.intern(node->name)));
  clone_module_parts(node, copy);
  return copy;
}

Node * NodeCloner::visit_variable(const Variable * node)
{
  auto * copy =
    stamp(target_.create<Variable>(target_.intern(node->name), node->isConstant, nullptr));
  copy->value = clone_as(node->value);
  return copy;
}

Node * NodeCloner::visit_return(const Return * node)
{
  auto * copy = stamp(target_.create<Return>());
  copy->value = clone_as(node->value);
  return copy;
}

Node * NodeCloner::visit_assignment(const Assignment * node)
{
  auto * copy = stamp(target_.create<Assignment>(nullptr, nullptr));
  copy->variable = clone_as(node->variable);
  copy->value = clone_as(node->value);
  return copy;
}

Node * NodeCloner::visit_reference(const Reference * node)
{
  return stamp(target_.create<Reference>(target_.intern(node->name)));
}

Node * NodeCloner::visit_self(const Self * /*node*/) { return stamp(target_.create<Self>()); }

Node * NodeCloner::visit_literal(const Literal * node)
{
  return stamp(target_.create<Literal>(node->literalKind, target_.intern(node->value)));
}

Node * NodeCloner::visit_send(const Send * node)
{
  auto * copy = stamp(target_.create<Send>(nullptr, target_.intern(node->message)));
  copy->receiver = clone_as(node->receiver);
  copy->args = clone_all(node->args);
  return copy;
}

Node * NodeCloner::visit_new(const New * node)
{
  auto * copy = stamp(target_.create<New>(nullptr));
  copy->instantiated = clone_as(node->instantiated);
  copy->args = clone_all(node->args);
  return copy;
}

Node * NodeCloner::visit_if(const If * node)
{
  auto * copy = stamp(target_.create<If>(nullptr, nullptr));
  copy->condition = clone_as(node->condition);
  copy->thenBody = clone_as(node->thenBody);
  copy->elseBody = clone_as(node->elseBody);
  return copy;
}

Node * NodeCloner::visit_throw(const Throw * node)
{
  auto * copy = stamp(target_.create<Throw>(nullptr));
  copy->exception = clone_as(node->exception);
  return copy;
}

Node * NodeCloner::visit_field(const Field * node)
{
  auto * copy =
    stamp(target_.create<Field>(target_.intern(node->name), node->isConstant, nullptr));
  copy->value = clone_as(node->value);
  return copy;
}

Node * NodeCloner::visit_method(const Method * node)
{
  auto * copy = stamp(target_.create<Method>(target_.intern(node->name)));
  copy->parameters = clone_all(node->parameters);
  copy->body = clone_as(node->body);
  return copy;
}

Node * NodeCloner::visit_parameter(const Parameter * node)
{
  return stamp(target_.create<Parameter>(target_.intern(node->name), node->isVarArg));
}

Node * NodeCloner::visit_import(const Import * node)
{
  auto * copy = stamp(target_.create<Import>(nullptr, node->isGeneric));
  copy->entity = clone_as(node->entity);
  return copy;
}

Node * NodeCloner::visit_body(const Body * node)
{
  auto * copy = stamp(target_.create<Body>());
  copy->sentences = clone_all(node->sentences);
  return copy;
}

Node * NodeCloner::visit_parameterized_type(const ParameterizedType * node)
{
  auto * copy = stamp(target_.create<ParameterizedType>(nullptr));
  copy->reference = clone_as(node->reference);
  return copy;
}

gsl::span<Problem> NodeCloner::clone_problems(gsl::span<Problem> source)
{
  auto result = target_.allocate_array<Problem>(source.size());
  auto out = result.begin();
  for (const Problem & problem : source) {
    auto values = target_.allocate_array<std::string_view>(problem.values.size());
    auto value_out = values.begin();
    for (std::string_view value : problem.values) {
      *value_out = target_.intern(value);
      ++value_out;
    }
    out->code = target_.intern(problem.code);
    out->level = problem.level;
    out->values = values;
    ++out;
  }
  return result;
}

// ============================================================================
// copy_package
// ============================================================================

Package * copy_package(ModelContext & ctx, const Package & source, const PackageOverrides & overrides)
{
  auto * copy =
    ctx.create<Package>(ctx.intern(source.name), ctx.intern(source.fileName), source.isTestFile);
  copy->imports = overrides.imports ? *overrides.imports : source.imports;
  copy->members = overrides.members ? ctx.copy_to_arena(*overrides.members) : source.members;
  copy->problems = overrides.problems ? *overrides.problems : source.problems;
  return copy;
}

}  // namespace scopelink
