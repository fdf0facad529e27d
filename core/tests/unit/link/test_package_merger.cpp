// tests/unit/link/test_package_merger.cpp - Unit tests for package merging
//

#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "scopelink/basic/casting.hpp"
#include "scopelink/link/package_merger.hpp"
#include "scopelink/test_support/model_helpers.hpp"

using namespace scopelink;
using scopelink::test_support::read_model;

namespace
{

std::vector<std::string_view> names_of(const std::vector<Entity *> & members)
{
  std::vector<std::string_view> names;
  for (const Entity * member : members) {
    names.push_back(member->name);
  }
  return names;
}

std::vector<std::string_view> names_of(gsl::span<Entity *> members)
{
  return names_of(std::vector<Entity *>(members.begin(), members.end()));
}

Package * find_sub_package(const Package * pkg, std::string_view name)
{
  for (Entity * member : pkg->members) {
    if (auto * sub = dyn_cast<Package>(member); sub != nullptr && sub->name == name) {
      return sub;
    }
  }
  return nullptr;
}

}  // namespace

// ============================================================================
// Non-package members
// ============================================================================

TEST(LinkPackageMerger, NonPackageReplacesSameNameAndMovesLast)
{
  ModelContext scratch;
  ModelContext ctx;
  auto * a = ctx.create<Class>(ctx.intern("A"));
  auto * b = ctx.create<Package>(ctx.intern("B"));
  auto * c = ctx.create<Mixin>(ctx.intern("C"));
  auto * new_a = ctx.create<Singleton>(ctx.intern("A"));

  PackageMerger merger(scratch);
  const auto merged = merger.merge({a, b, c}, new_a);

  ASSERT_EQ(merged.size(), 3U);
  EXPECT_EQ(merged[0], b);
  EXPECT_EQ(merged[1], c);
  EXPECT_EQ(merged[2], new_a);
}

TEST(LinkPackageMerger, NonPackageReplacesMemberOfAnyKindInAnyPosition)
{
  ModelContext scratch;
  ModelContext ctx;
  const std::vector<std::vector<std::string_view>> orders = {
    {"X", "Y", "Z"}, {"Y", "X", "Z"}, {"Y", "Z", "X"}};

  for (const auto & order : orders) {
    std::vector<Entity *> members;
    for (std::string_view name : order) {
      if (name == "X") {
        members.push_back(ctx.create<Package>(ctx.intern(name), ctx.intern("x.src")));
      } else {
        members.push_back(ctx.create<Class>(ctx.intern(name)));
      }
    }
    auto * incoming = ctx.create<Class>(ctx.intern("X"));

    PackageMerger merger(scratch);
    const auto merged = merger.merge(members, incoming);

    ASSERT_EQ(merged.size(), 3U);
    EXPECT_EQ(merged.back(), incoming);
    EXPECT_EQ(names_of(merged), (std::vector<std::string_view>{"Y", "Z", "X"}));
  }
}

// ============================================================================
// Packages
// ============================================================================

TEST(LinkPackageMerger, UnmatchedPackageIsAppended)
{
  auto unit = read_model(R"([
    {"kind": "Package", "name": "p", "fileName": "p.src"},
    {"kind": "Package", "name": "p", "fileName": "other.src"},
    {"kind": "Package", "name": "q", "fileName": "p.src"}
  ])");
  ASSERT_TRUE(unit.diags.empty());
  ASSERT_EQ(unit.packages.size(), 3U);

  ModelContext scratch;
  PackageMerger merger(scratch);
  const auto merged = merger.merge_all({}, unit.packages);

  ASSERT_EQ(merged.size(), 3U);
  EXPECT_EQ(merged[0], unit.packages[0]);
  EXPECT_EQ(merged[1], unit.packages[1]);
  EXPECT_EQ(merged[2], unit.packages[2]);
}

TEST(LinkPackageMerger, RelinkedPackageReplacesDirectDeclarations)
{
  auto unit = read_model(R"({
    "kind": "Package", "name": "p", "fileName": "p.src",
    "members": [{"kind": "Class", "name": "A"}]
  })");
  auto updated = unit.read(R"({
    "kind": "Package", "name": "p", "fileName": "p.src",
    "members": [{"kind": "Class", "name": "B"}]
  })");
  ASSERT_TRUE(unit.diags.empty());

  ModelContext scratch;
  PackageMerger merger(scratch);
  auto merged = merger.merge_all({}, unit.packages);
  merged = merger.merge_all(std::move(merged), updated);

  ASSERT_EQ(merged.size(), 1U);
  const auto * p = cast<Package>(merged[0]);
  EXPECT_EQ(names_of(p->members), (std::vector<std::string_view>{"B"}));
}

TEST(LinkPackageMerger, SubPackagesMergeRecursively)
{
  auto unit = read_model(R"({
    "kind": "Package", "name": "p", "fileName": "p.src",
    "members": [
      {"kind": "Package", "name": "inner", "fileName": "inner.src",
       "members": [{"kind": "Class", "name": "X"}]},
      {"kind": "Class", "name": "Old"}
    ]
  })");
  auto updated = unit.read(R"({
    "kind": "Package", "name": "p", "fileName": "p.src",
    "members": [
      {"kind": "Class", "name": "New"},
      {"kind": "Package", "name": "inner", "fileName": "inner.src",
       "members": [{"kind": "Class", "name": "Y"}]}
    ]
  })");
  ASSERT_TRUE(unit.diags.empty());

  ModelContext scratch;
  PackageMerger merger(scratch);
  const auto merged = merger.merge_all(merger.merge_all({}, unit.packages), updated);

  ASSERT_EQ(merged.size(), 1U);
  const auto * p = cast<Package>(merged[0]);
  // Sub-packages first, then the incoming non-package members
  EXPECT_EQ(names_of(p->members), (std::vector<std::string_view>{"inner", "New"}));

  const Package * inner = find_sub_package(p, "inner");
  ASSERT_NE(inner, nullptr);
  EXPECT_EQ(names_of(inner->members), (std::vector<std::string_view>{"X", "Y"}));
}

TEST(LinkPackageMerger, ImportsAndProblemsComeFromIncomingPackage)
{
  auto unit = read_model(R"({
    "kind": "Package", "name": "p", "fileName": "p.src",
    "imports": [{"kind": "Import", "entity": "old.A"}],
    "problems": [{"code": "oldProblem"}]
  })");
  auto updated = unit.read(R"({
    "kind": "Package", "name": "p", "fileName": "p.src",
    "imports": [{"kind": "Import", "entity": "new.B", "isGeneric": true}],
    "problems": [{"code": "newProblem", "level": "warning", "values": ["v"]}]
  })");
  ASSERT_TRUE(unit.diags.empty());

  ModelContext scratch;
  PackageMerger merger(scratch);
  const auto merged = merger.merge_all(merger.merge_all({}, unit.packages), updated);

  ASSERT_EQ(merged.size(), 1U);
  const auto * p = cast<Package>(merged[0]);
  ASSERT_EQ(p->imports.size(), 1U);
  EXPECT_EQ(p->imports[0]->entity->name, "new.B");
  EXPECT_TRUE(p->imports[0]->isGeneric);
  ASSERT_EQ(p->problems.size(), 1U);
  EXPECT_EQ(p->problems[0].code, "newProblem");
  EXPECT_EQ(p->problems[0].level, Severity::Warning);
}

TEST(LinkPackageMerger, MergedPackageMovesToTheEnd)
{
  auto unit = read_model(R"([
    {"kind": "Package", "name": "p", "fileName": "p.src"},
    {"kind": "Package", "name": "q", "fileName": "q.src"}
  ])");
  auto updated = unit.read(R"({"kind": "Package", "name": "p", "fileName": "p.src"})");
  ASSERT_TRUE(unit.diags.empty());

  ModelContext scratch;
  PackageMerger merger(scratch);
  const auto merged = merger.merge_all(merger.merge_all({}, unit.packages), updated);

  EXPECT_EQ(names_of(merged), (std::vector<std::string_view>{"q", "p"}));
}

TEST(LinkPackageMerger, InputsAreNotModified)
{
  auto unit = read_model(R"({
    "kind": "Package", "name": "p", "fileName": "p.src",
    "members": [{"kind": "Class", "name": "A"}]
  })");
  auto updated = unit.read(R"({
    "kind": "Package", "name": "p", "fileName": "p.src",
    "members": [{"kind": "Class", "name": "B"}]
  })");
  ASSERT_TRUE(unit.diags.empty());

  ModelContext scratch;
  PackageMerger merger(scratch);
  const auto merged = merger.merge_all(merger.merge_all({}, unit.packages), updated);

  ASSERT_EQ(merged.size(), 1U);
  EXPECT_NE(merged[0], unit.packages[0]);
  EXPECT_NE(merged[0], updated[0]);
  EXPECT_EQ(names_of(unit.packages[0]->members), (std::vector<std::string_view>{"A"}));
  EXPECT_EQ(names_of(updated[0]->members), (std::vector<std::string_view>{"B"}));
}
