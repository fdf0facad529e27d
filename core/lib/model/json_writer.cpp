// scopelink/model/json_writer.cpp - JSON dumps of model trees and scopes
//
#include "scopelink/model/json_writer.hpp"

#include <string>

#include "scopelink/link/scope.hpp"
#include "scopelink/model/model_enums.hpp"
#include "scopelink/model/visitor.hpp"

namespace scopelink
{
namespace
{

using nlohmann::json;

class JsonWriter : public ConstModelVisitor<JsonWriter, json>
{
public:
  json visit_environment(const Environment * node)
  {
    json j = header(node);
    j["members"] = list(node->members);
    return j;
  }

  json visit_package(const Package * node)
  {
    json j = header(node);
    j["name"] = std::string(node->name);
    j["fileName"] = std::string(node->fileName);
    j["isTestFile"] = node->isTestFile;
    j["imports"] = list(node->imports);
    j["members"] = list(node->members);
    json problems = json::array();
    for (const Problem & problem : node->problems) {
      json values = json::array();
      for (std::string_view value : problem.values) {
        values.push_back(std::string(value));
      }
      problems.push_back(
        json{
          {"code", std::string(problem.code)},
          {"level", std::string(to_string(problem.level))},
          {"values", values}});
    }
    j["problems"] = problems;
    return j;
  }

  json visit_program(const Program * node) { return named_with_body(node, node->body); }
  json visit_test(const Test * node) { return named_with_body(node, node->body); }

  json visit_class(const Class * node) { return module(node); }
  json visit_singleton(const Singleton * node) { return module(node); }
  json visit_mixin(const Mixin * node) { return module(node); }
  json visit_describe(const Describe * node) { return module(node); }

  json visit_variable(const Variable * node)
  {
    json j = header(node);
    j["name"] = std::string(node->name);
    j["isConstant"] = node->isConstant;
    optional_child(j, "value", node->value);
    return j;
  }

  json visit_return(const Return * node)
  {
    json j = header(node);
    optional_child(j, "value", node->value);
    return j;
  }

  json visit_assignment(const Assignment * node)
  {
    json j = header(node);
    j["variable"] = visit(node->variable);
    j["value"] = visit(node->value);
    return j;
  }

  json visit_reference(const Reference * node)
  {
    json j = header(node);
    j["name"] = std::string(node->name);
    return j;
  }

  json visit_self(const Self * node) { return header(node); }

  json visit_literal(const Literal * node)
  {
    json j = header(node);
    j["literalKind"] = std::string(to_string(node->literalKind));
    j["value"] = std::string(node->value);
    return j;
  }

  json visit_send(const Send * node)
  {
    json j = header(node);
    j["receiver"] = visit(node->receiver);
    j["message"] = std::string(node->message);
    j["args"] = list(node->args);
    return j;
  }

  json visit_new(const New * node)
  {
    json j = header(node);
    j["instantiated"] = visit(node->instantiated);
    j["args"] = list(node->args);
    return j;
  }

  json visit_if(const If * node)
  {
    json j = header(node);
    j["condition"] = visit(node->condition);
    j["then"] = visit(node->thenBody);
    optional_child(j, "else", node->elseBody);
    return j;
  }

  json visit_throw(const Throw * node)
  {
    json j = header(node);
    j["exception"] = visit(node->exception);
    return j;
  }

  json visit_field(const Field * node)
  {
    json j = header(node);
    j["name"] = std::string(node->name);
    j["isConstant"] = node->isConstant;
    optional_child(j, "value", node->value);
    return j;
  }

  json visit_method(const Method * node)
  {
    json j = header(node);
    j["name"] = std::string(node->name);
    j["parameters"] = list(node->parameters);
    optional_child(j, "body", node->body);
    return j;
  }

  json visit_parameter(const Parameter * node)
  {
    json j = header(node);
    j["name"] = std::string(node->name);
    j["isVarArg"] = node->isVarArg;
    return j;
  }

  json visit_import(const Import * node)
  {
    json j = header(node);
    j["entity"] = visit(node->entity);
    j["isGeneric"] = node->isGeneric;
    return j;
  }

  json visit_body(const Body * node)
  {
    json j = header(node);
    j["sentences"] = list(node->sentences);
    return j;
  }

  json visit_parameterized_type(const ParameterizedType * node)
  {
    json j = header(node);
    j["reference"] = visit(node->reference);
    return j;
  }

private:
  static json header(const Node * node)
  {
    json j{{"kind", std::string(to_string(node->kind))}};
    if (node->id.is_valid()) {
      j["id"] = to_string(node->id);
    }
    return j;
  }

  template <typename T>
  json list(gsl::span<T *> children)
  {
    json arr = json::array();
    for (const T * child : children) {
      arr.push_back(visit(child));
    }
    return arr;
  }

  void optional_child(json & j, const char * key, const Node * child)
  {
    if (child != nullptr) {
      j[key] = visit(child);
    }
  }

  json named_with_body(const Entity * node, const Body * body)
  {
    json j = header(node);
    j["name"] = std::string(node->name);
    optional_child(j, "body", body);
    return j;
  }

  json module(const Module * node)
  {
    json j = header(node);
    j["name"] = std::string(node->name);
    j["supertypes"] = list(node->supertypes);
    j["members"] = list(node->members);
    return j;
  }
};

}  // namespace

json to_json(const Node * node)
{
  if (node == nullptr) {
    return nullptr;
  }
  JsonWriter writer;
  return writer.visit(node);
}

json to_json(const Scope & scope)
{
  json contributions = json::array();
  for (const auto & [name, node] : scope.local_contributions()) {
    json entry{{"name", std::string(name)}, {"kind", std::string(to_string(node->kind))}};
    if (node->id.is_valid()) {
      entry["id"] = to_string(node->id);
    }
    contributions.push_back(entry);
  }
  return json{
    {"contributions", contributions},
    {"included", scope.included().size()},
    {"hasContainer", scope.container() != nullptr}};
}

}  // namespace scopelink
