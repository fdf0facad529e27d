// scopelink/model/json_reader.hpp - Building model trees from JSON
//
// Parsing source text is done by an external front end; model trees reach the
// linker as JSON documents. A node is an object with a "kind" field naming its
// class (see model_nodes.def). Shorthands are accepted where they are
// unambiguous:
//
//   "Animal"                  for a ParameterizedType / Reference by name
//   "x"                       for a Parameter by name
//   [ sentence, ... ]         for a Body
//
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

#include "scopelink/basic/diagnostic.hpp"
#include "scopelink/model/model.hpp"
#include "scopelink/model/model_context.hpp"

namespace scopelink
{

/**
 * Reads model trees into a ModelContext.
 *
 * Malformed input is reported to the DiagnosticBag (code "malformedModel") and
 * the read returns an empty result; nothing is thrown to the caller.
 */
class ModelReader
{
public:
  /**
   * @param ctx Context the nodes are allocated in
   * @param diags Receives format errors
   * @param source Name used to locate diagnostics (file path), may be empty
   */
  ModelReader(ModelContext & ctx, DiagnosticBag & diags, std::string source = {});

  /// Read a Package object or an array of Package objects.
  [[nodiscard]] std::vector<Package *> read_packages(const nlohmann::json & doc);

  [[nodiscard]] std::vector<Package *> read_packages_text(std::string_view text);

  /// Read a single sentence (Variable, Return, Assignment or an expression).
  [[nodiscard]] Node * read_sentence(const nlohmann::json & doc);

  [[nodiscard]] Node * read_sentence_text(std::string_view text);

private:
  Node * read_node(const nlohmann::json & j);

  template <typename T>
  T * read_as(const nlohmann::json & j, std::string_view role);

  Package * read_package(const nlohmann::json & j);
  Entity * read_entity(const nlohmann::json & j);
  Node * read_module_member(const nlohmann::json & j);
  Node * read_sentence_node(const nlohmann::json & j);
  Expr * read_expr(const nlohmann::json & j);
  Expr * read_optional_expr(const nlohmann::json & j, const char * key);
  Reference * read_reference(const nlohmann::json & j);
  ParameterizedType * read_type(const nlohmann::json & j);
  Parameter * read_parameter(const nlohmann::json & j);
  Body * read_body(const nlohmann::json & j);
  Body * read_optional_body(const nlohmann::json & j, const char * key);
  Literal * read_literal(const nlohmann::json & j);
  gsl::span<Problem> read_problems(const nlohmann::json & j);

  template <typename T, typename ReadFn>
  gsl::span<T *> read_list(const nlohmann::json & j, const char * key, ReadFn read);

  std::string_view read_name(const nlohmann::json & j, bool required = true);

  void report(std::string_view message);

  ModelContext & ctx_;
  DiagnosticBag & diags_;
  std::string source_;
};

/**
 * Read the packages of a JSON model file.
 *
 * I/O errors are reported to `diags` like format errors.
 */
[[nodiscard]] std::vector<Package *> read_model_file(
  const std::filesystem::path & path, ModelContext & ctx, DiagnosticBag & diags);

}  // namespace scopelink
