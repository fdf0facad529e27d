// scopelink/model/json_reader.cpp - Building model trees from JSON
//
#include "scopelink/model/json_reader.hpp"

#include <fmt/core.h>

#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "scopelink/basic/casting.hpp"
#include "scopelink/model/model_enums.hpp"

namespace scopelink
{

namespace
{

using nlohmann::json;

constexpr const char * k_malformed_model = "malformedModel";

/// Raised while reading; converted into a diagnostic at the entry points.
class ModelFormatError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

bool has_value(const json & j, const char * key)
{
  auto it = j.find(key);
  return it != j.end() && !it->is_null();
}

bool read_flag(const json & j, const char * key)
{
  return has_value(j, key) && j.at(key).get<bool>();
}

std::string describe(const json & j)
{
  if (j.is_object() && j.contains("kind") && j.at("kind").is_string()) {
    return j.at("kind").get<std::string>();
  }
  return std::string(j.type_name());
}

}  // namespace

ModelReader::ModelReader(ModelContext & ctx, DiagnosticBag & diags, std::string source)
: ctx_(ctx), diags_(diags), source_(std::move(source))
{
}

// ============================================================================
// Entry points
// ============================================================================

std::vector<Package *> ModelReader::read_packages(const json & doc)
{
  std::vector<Package *> packages;
  try {
    if (doc.is_array()) {
      for (const json & item : doc) {
        packages.push_back(read_package(item));
      }
    } else {
      packages.push_back(read_package(doc));
    }
  } catch (const ModelFormatError & e) {
    report(e.what());
    packages.clear();
  } catch (const json::exception & e) {
    report(e.what());
    packages.clear();
  }
  return packages;
}

std::vector<Package *> ModelReader::read_packages_text(std::string_view text)
{
  json doc;
  try {
    doc = json::parse(text.begin(), text.end());
  } catch (const json::parse_error & e) {
    report(e.what());
    return {};
  }
  return read_packages(doc);
}

Node * ModelReader::read_sentence(const json & doc)
{
  try {
    return read_sentence_node(doc);
  } catch (const ModelFormatError & e) {
    report(e.what());
  } catch (const json::exception & e) {
    report(e.what());
  }
  return nullptr;
}

Node * ModelReader::read_sentence_text(std::string_view text)
{
  json doc;
  try {
    doc = json::parse(text.begin(), text.end());
  } catch (const json::parse_error & e) {
    report(e.what());
    return nullptr;
  }
  return read_sentence(doc);
}

void ModelReader::report(std::string_view message)
{
  auto builder = diags_.report_error(fmt::format("malformed model: {}", message));
  builder.with_code(k_malformed_model);
  if (!source_.empty()) {
    builder.in_file(source_);
  }
}

// ============================================================================
// Nodes
// ============================================================================

template <typename T>
T * ModelReader::read_as(const json & j, std::string_view role)
{
  Node * node = read_node(j);
  auto * typed = dyn_cast<T>(node);
  if (typed == nullptr) {
    throw ModelFormatError(fmt::format("{} expected, got {}", role, to_string(node->kind)));
  }
  return typed;
}

template <typename T, typename ReadFn>
gsl::span<T *> ModelReader::read_list(const json & j, const char * key, ReadFn read)
{
  if (!has_value(j, key)) {
    return {};
  }
  const json & items = j.at(key);
  if (!items.is_array()) {
    throw ModelFormatError(fmt::format("'{}' must be an array", key));
  }
  std::vector<T *> nodes;
  nodes.reserve(items.size());
  for (const json & item : items) {
    nodes.push_back(read(item));
  }
  return ctx_.copy_to_arena(nodes);
}

std::string_view ModelReader::read_name(const json & j, bool required)
{
  if (!has_value(j, "name")) {
    if (required) {
      throw ModelFormatError(fmt::format("{} without a name", describe(j)));
    }
    return {};
  }
  return ctx_.intern(j.at("name").get<std::string>());
}

Node * ModelReader::read_node(const json & j)
{
  if (!j.is_object()) {
    throw ModelFormatError(fmt::format("node object expected, got {}", j.type_name()));
  }
  const auto kind_name = j.at("kind").get<std::string>();
  const auto kind = parse_node_kind(kind_name);
  if (!kind) {
    throw ModelFormatError(fmt::format("unknown node kind '{}'", kind_name));
  }

  switch (*kind) {
    case NodeKind::Environment:
      throw ModelFormatError("an Environment cannot be read, link packages instead");
    case NodeKind::Package:
      return read_package(j);
    case NodeKind::Program: {
      auto * node = ctx_.create<Program>(read_name(j), nullptr);
      node->body = read_optional_body(j, "body");
      return node;
    }
    case NodeKind::Test: {
      auto * node = ctx_.create<Test>(read_name(j), nullptr);
      node->body = read_optional_body(j, "body");
      return node;
    }
    case NodeKind::Class:
    case NodeKind::Singleton:
    case NodeKind::Mixin:
    case NodeKind::Describe: {
      Module * module = nullptr;
      if (*kind == NodeKind::Class) {
        module = ctx_.create<Class>(read_name(j));
      } else if (*kind == NodeKind::Singleton) {
        module = ctx_.create<Singleton>(read_name(j, false));
      } else if (*kind == NodeKind::Mixin) {
        module = ctx_.create<Mixin>(read_name(j));
      } else {
        module = ctx_.create<Describe>(read_name(j));
      }
      module->supertypes = read_list<ParameterizedType>(
        j, "supertypes", [this](const json & item) { return read_type(item); });
      module->members = read_list<Node>(
        j, "members", [this](const json & item) { return read_module_member(item); });
      return module;
    }
    case NodeKind::Variable:
      return ctx_.create<Variable>(
        read_name(j), read_flag(j, "isConstant"), read_optional_expr(j, "value"));
    case NodeKind::Return:
      return ctx_.create<Return>(read_optional_expr(j, "value"));
    case NodeKind::Assignment: {
      Reference * variable = read_reference(j.at("variable"));
      return ctx_.create<Assignment>(variable, read_expr(j.at("value")));
    }
    case NodeKind::Reference:
      return ctx_.create<Reference>(read_name(j));
    case NodeKind::Self:
      return ctx_.create<Self>();
    case NodeKind::Literal:
      return read_literal(j);
    case NodeKind::Send: {
      Expr * receiver = read_expr(j.at("receiver"));
      auto * node = ctx_.create<Send>(receiver, ctx_.intern(j.at("message").get<std::string>()));
      node->args =
        read_list<Expr>(j, "args", [this](const json & item) { return read_expr(item); });
      return node;
    }
    case NodeKind::New: {
      auto * node = ctx_.create<New>(read_type(j.at("instantiated")));
      node->args =
        read_list<Expr>(j, "args", [this](const json & item) { return read_expr(item); });
      return node;
    }
    case NodeKind::If: {
      Expr * condition = read_expr(j.at("condition"));
      Body * then_body = read_body(j.at("then"));
      return ctx_.create<If>(condition, then_body, read_optional_body(j, "else"));
    }
    case NodeKind::Throw:
      return ctx_.create<Throw>(read_expr(j.at("exception")));
    case NodeKind::Field:
      return ctx_.create<Field>(
        read_name(j), read_flag(j, "isConstant"), read_optional_expr(j, "value"));
    case NodeKind::Method: {
      auto * node = ctx_.create<Method>(read_name(j));
      node->parameters = read_list<Parameter>(
        j, "parameters", [this](const json & item) { return read_parameter(item); });
      node->body = read_optional_body(j, "body");
      return node;
    }
    case NodeKind::Parameter:
      return ctx_.create<Parameter>(read_name(j), read_flag(j, "isVarArg"));
    case NodeKind::Import:
      return ctx_.create<Import>(read_reference(j.at("entity")), read_flag(j, "isGeneric"));
    case NodeKind::Body: {
      auto * node = ctx_.create<Body>();
      node->sentences = read_list<Node>(
        j, "sentences", [this](const json & item) { return read_sentence_node(item); });
      return node;
    }
    case NodeKind::ParameterizedType:
      return ctx_.create<ParameterizedType>(read_reference(j.at("reference")));
  }
  throw ModelFormatError(fmt::format("unsupported node kind '{}'", kind_name));
}

Package * ModelReader::read_package(const json & j)
{
  if (!j.is_object() || j.value("kind", std::string{}) != "Package") {
    throw ModelFormatError(fmt::format("Package expected, got {}", describe(j)));
  }

  std::string_view file_name;
  if (has_value(j, "fileName")) {
    file_name = ctx_.intern(j.at("fileName").get<std::string>());
  }
  auto * pkg = ctx_.create<Package>(read_name(j), file_name, read_flag(j, "isTestFile"));
  pkg->imports = read_list<Import>(
    j, "imports", [this](const json & item) { return read_as<Import>(item, "Import"); });
  pkg->members =
    read_list<Entity>(j, "members", [this](const json & item) { return read_entity(item); });
  pkg->problems = read_problems(j);
  return pkg;
}

Entity * ModelReader::read_entity(const json & j) { return read_as<Entity>(j, "entity"); }

Node * ModelReader::read_module_member(const json & j)
{
  Node * node = read_node(j);
  if (!isa<Field>(node) && !isa<Method>(node) && !isa<Test>(node) && !isa<Variable>(node)) {
    throw ModelFormatError(
      fmt::format("module member expected, got {}", to_string(node->kind)));
  }
  return node;
}

Node * ModelReader::read_sentence_node(const json & j)
{
  Node * node = read_node(j);
  if (!is_sentence(node)) {
    throw ModelFormatError(fmt::format("sentence expected, got {}", to_string(node->kind)));
  }
  return node;
}

Expr * ModelReader::read_expr(const json & j) { return read_as<Expr>(j, "expression"); }

Expr * ModelReader::read_optional_expr(const json & j, const char * key)
{
  return has_value(j, key) ? read_expr(j.at(key)) : nullptr;
}

Reference * ModelReader::read_reference(const json & j)
{
  if (j.is_string()) {
    return ctx_.create<Reference>(ctx_.intern(j.get<std::string>()));
  }
  return read_as<Reference>(j, "Reference");
}

ParameterizedType * ModelReader::read_type(const json & j)
{
  if (j.is_string() || (j.is_object() && j.value("kind", std::string{}) == "Reference")) {
    return ctx_.create<ParameterizedType>(read_reference(j));
  }
  return read_as<ParameterizedType>(j, "ParameterizedType");
}

Parameter * ModelReader::read_parameter(const json & j)
{
  if (j.is_string()) {
    return ctx_.create<Parameter>(ctx_.intern(j.get<std::string>()));
  }
  return read_as<Parameter>(j, "Parameter");
}

Body * ModelReader::read_body(const json & j)
{
  if (j.is_array()) {
    std::vector<Node *> sentences;
    sentences.reserve(j.size());
    for (const json & item : j) {
      sentences.push_back(read_sentence_node(item));
    }
    auto * body = ctx_.create<Body>();
    body->sentences = ctx_.copy_to_arena(sentences);
    return body;
  }
  return read_as<Body>(j, "Body");
}

Body * ModelReader::read_optional_body(const json & j, const char * key)
{
  return has_value(j, key) ? read_body(j.at(key)) : nullptr;
}

Literal * ModelReader::read_literal(const json & j)
{
  const json value = j.value("value", json(nullptr));

  std::optional<LiteralKind> kind;
  if (has_value(j, "literalKind")) {
    const auto kind_name = j.at("literalKind").get<std::string>();
    kind = parse_literal_kind(kind_name);
    if (!kind) {
      throw ModelFormatError(fmt::format("unknown literal kind '{}'", kind_name));
    }
  } else if (value.is_boolean()) {
    kind = LiteralKind::Boolean;
  } else if (value.is_number()) {
    kind = LiteralKind::Number;
  } else if (value.is_string()) {
    kind = LiteralKind::String;
  } else {
    kind = LiteralKind::Null;
  }

  // The raw text is kept as written: strings unquoted, everything else dumped.
  const std::string raw = value.is_string() ? value.get<std::string>() : value.dump();
  return ctx_.create<Literal>(*kind, ctx_.intern(raw));
}

gsl::span<Problem> ModelReader::read_problems(const json & j)
{
  if (!has_value(j, "problems")) {
    return {};
  }
  const json & items = j.at("problems");
  if (!items.is_array()) {
    throw ModelFormatError("'problems' must be an array");
  }

  auto problems = ctx_.allocate_array<Problem>(items.size());
  auto out = problems.begin();
  for (const json & item : items) {
    out->code = ctx_.intern(item.at("code").get<std::string>());
    if (has_value(item, "level")) {
      const auto level_name = item.at("level").get<std::string>();
      const auto level = parse_severity(level_name);
      if (!level) {
        throw ModelFormatError(fmt::format("unknown problem level '{}'", level_name));
      }
      out->level = *level;
    }
    std::vector<std::string_view> values;
    if (has_value(item, "values")) {
      for (const json & value : item.at("values")) {
        values.push_back(ctx_.intern(value.get<std::string>()));
      }
    }
    out->values = ctx_.copy_to_arena(values);
    ++out;
  }
  return problems;
}

// ============================================================================
// Files
// ============================================================================

std::vector<Package *> read_model_file(
  const std::filesystem::path & path, ModelContext & ctx, DiagnosticBag & diags)
{
  std::ifstream in(path);
  if (!in) {
    diags.report_error(fmt::format("cannot open model file '{}'", path.string()))
      .with_code("unreadableModel")
      .in_file(path.string());
    return {};
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  ModelReader reader(ctx, diags, path.string());
  return reader.read_packages_text(buffer.str());
}

}  // namespace scopelink
