// tests/unit/model/test_traversal.cpp - Unit tests for child iteration and naming
//

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "scopelink/basic/casting.hpp"
#include "scopelink/model/qualified_name.hpp"
#include "scopelink/model/traversal.hpp"
#include "scopelink/test_support/model_helpers.hpp"

using namespace scopelink;
using scopelink::test_support::find_named;
using scopelink::test_support::read_model;

namespace
{

std::vector<std::string> kinds_in_preorder(Node * root)
{
  std::vector<std::string> kinds;
  walk_preorder(root, [&kinds](Node * node, Node * /*parent*/) {
    kinds.emplace_back(to_string(node->kind));
  });
  return kinds;
}

constexpr const char * k_package = R"({
  "kind": "Package", "name": "p", "fileName": "p.src",
  "imports": [{"kind": "Import", "entity": "q.B"}],
  "members": [
    {"kind": "Class", "name": "A", "supertypes": ["Base"], "members": [
      {"kind": "Field", "name": "x", "value": {"kind": "Literal", "value": 0}},
      {"kind": "Method", "name": "m", "parameters": ["y"], "body": [
        {"kind": "If", "condition": {"kind": "Reference", "name": "y"},
         "then": [{"kind": "Return", "value": {"kind": "Self"}}]}
      ]}
    ]},
    {"kind": "Package", "name": "inner", "fileName": "inner.src",
     "members": [{"kind": "Singleton"}]}
  ]
})";

}  // namespace

TEST(ModelTraversal, PreorderFollowsDeclarationOrder)
{
  auto unit = read_model(k_package);
  ASSERT_EQ(unit.packages.size(), 1U);

  EXPECT_EQ(
    kinds_in_preorder(unit.packages[0]),
    (std::vector<std::string>{
      "Package", "Import", "Reference", "Class", "ParameterizedType", "Reference", "Field",
      "Literal", "Method", "Parameter", "Body", "If", "Reference", "Body", "Return", "Self",
      "Package", "Singleton"}));
}

TEST(ModelTraversal, WalkReportsStructuralParents)
{
  auto unit = read_model(k_package);
  Node * root = unit.packages[0];

  walk_preorder(root, [root](Node * node, Node * parent) {
    if (node == root) {
      EXPECT_EQ(parent, nullptr);
      return;
    }
    ASSERT_NE(parent, nullptr);
    const auto siblings = children_of(parent);
    EXPECT_NE(std::find(siblings.begin(), siblings.end(), node), siblings.end());
  });
}

TEST(ModelTraversal, ChildrenSkipAbsentParts)
{
  auto unit = read_model(R"({"kind": "Package", "name": "p", "fileName": "p.src",
    "members": [{"kind": "Class", "name": "A", "members": [
      {"kind": "Method", "name": "abstract"},
      {"kind": "Variable", "name": "v"}
    ]}]})");
  auto * method = find_named<Class>(unit.packages[0], "A");
  ASSERT_NE(method, nullptr);

  const auto members = children_of(method);
  ASSERT_EQ(members.size(), 2U);
  EXPECT_TRUE(children_of(members[0]).empty());
  EXPECT_TRUE(children_of(members[1]).empty());
}

TEST(ModelTraversal, CountNodes)
{
  auto unit = read_model(k_package);
  EXPECT_EQ(count_nodes(unit.packages[0]), 18U);
  EXPECT_EQ(count_nodes(nullptr), 0U);
}

TEST(ModelTraversal, ConstWalkVisitsTheSameNodes)
{
  auto unit = read_model(k_package);
  const Node * root = unit.packages[0];

  size_t visited = 0;
  for_each_child(root, [&visited](const Node * child) {
    EXPECT_NE(child, nullptr);
    ++visited;
  });
  EXPECT_EQ(visited, 3U);  // import, class, sub-package
}

// ============================================================================
// Qualified names
// ============================================================================

TEST(ModelQualifiedName, UsesParentBackReferences)
{
  ModelContext ctx;
  auto * outer = ctx.create<Package>("p");
  auto * inner = ctx.create<Package>("q");
  auto * cls = ctx.create<Class>("A");
  auto * anonymous = ctx.create<Singleton>();
  auto * field = ctx.create<Field>("x", false);
  inner->parent = outer;
  cls->parent = inner;
  anonymous->parent = cls;
  field->parent = anonymous;

  EXPECT_EQ(qualified_name(cls), "p.q.A");
  EXPECT_EQ(qualified_name(field), "p.q.A");
  EXPECT_EQ(qualified_name(outer), "p");
  EXPECT_EQ(qualified_name(nullptr), "");
  EXPECT_EQ(enclosing_package(field), inner);
  EXPECT_EQ(enclosing_package(outer), outer);
}

TEST(ModelQualifiedName, DetachedNodeHasNoPackage)
{
  ModelContext ctx;
  auto * ref = ctx.create<Reference>("x");
  EXPECT_EQ(qualified_name(ref), "");
  EXPECT_EQ(enclosing_package(ref), nullptr);
}
