// tests/unit/model/test_model_context.cpp - Unit tests for the model arena
//

#include <gtest/gtest.h>

#include <string>

#include "scopelink/basic/casting.hpp"
#include "scopelink/link/scope.hpp"
#include "scopelink/model/model.hpp"
#include "scopelink/model/model_context.hpp"

using namespace scopelink;

TEST(ModelContextTest, InternDeduplicatesAndOutlivesSource)
{
  ModelContext ctx;
  std::string_view first;
  {
    std::string temporary = "Animal";
    first = ctx.intern(temporary);
  }
  const std::string_view second = ctx.intern("Animal");

  EXPECT_EQ(first, "Animal");
  EXPECT_EQ(first.data(), second.data());
  EXPECT_TRUE(ctx.is_interned("Animal"));
  EXPECT_FALSE(ctx.is_interned("Dog"));
  EXPECT_EQ(ctx.get_string_count(), 1U);
}

TEST(ModelContextTest, CreatedNodesStartUnlinked)
{
  ModelContext ctx;
  auto * cls = ctx.create<Class>(ctx.intern("A"));

  EXPECT_EQ(cls->kind, NodeKind::Class);
  EXPECT_TRUE(isa<Module>(cls));
  EXPECT_TRUE(isa<Entity>(cls));
  EXPECT_FALSE(cls->id.is_valid());
  EXPECT_EQ(cls->scope, nullptr);
  EXPECT_EQ(cls->parent, nullptr);
  EXPECT_FALSE(cls->is_linked());
}

TEST(ModelContextTest, CopyToArenaKeepsOrder)
{
  ModelContext ctx;
  auto * a = ctx.create<Class>("A");
  auto * b = ctx.create<Mixin>("B");
  std::vector<Entity *> members{a, b};

  auto span = ctx.copy_to_arena(members);
  members.clear();

  ASSERT_EQ(span.size(), 2U);
  EXPECT_EQ(span[0], a);
  EXPECT_EQ(span[1], b);
  EXPECT_TRUE(ctx.allocate_array<Node *>(0).empty());
}

TEST(ModelContextTest, ScopesAreOwnedByTheContext)
{
  ModelContext ctx;
  Scope * outer = ctx.create_scope();
  Scope * inner = ctx.create_scope(outer);

  EXPECT_EQ(ctx.scope_count(), 2U);
  EXPECT_EQ(outer->container(), nullptr);
  EXPECT_EQ(inner->container(), outer);
}

TEST(ModelContextTest, NodeCacheFindsStampedNodes)
{
  ModelContext ctx;
  auto * cls = ctx.create<Class>("A");
  auto * unstamped = ctx.create<Class>("B");
  cls->id = ctx.next_id();

  ctx.cache_node(cls);
  ctx.cache_node(unstamped);
  ctx.cache_node(nullptr);

  EXPECT_EQ(ctx.cached_node_count(), 1U);
  EXPECT_EQ(ctx.node_by_id(cls->id), cls);
  EXPECT_EQ(ctx.node_by_id(NodeId{999}), nullptr);

  ctx.clear_node_cache();
  EXPECT_EQ(ctx.node_by_id(cls->id), nullptr);
}

TEST(ModelContextTest, IdsContinueFromSeed)
{
  ModelContext ctx(IdGenerator(IdStrategy::Counter, 41));
  EXPECT_EQ(ctx.next_id().value, 41U);
  EXPECT_EQ(ctx.ids().high_water_mark(), 41U);
}

TEST(ModelContextTest, KindCategories)
{
  EXPECT_TRUE(is_entity_kind(NodeKind::Variable));
  EXPECT_TRUE(is_sentence_kind(NodeKind::Variable));
  EXPECT_TRUE(is_sentence_kind(NodeKind::Send));
  EXPECT_TRUE(is_expr_kind(NodeKind::Throw));
  EXPECT_FALSE(is_expr_kind(NodeKind::Return));
  EXPECT_FALSE(is_sentence_kind(NodeKind::Field));
  EXPECT_TRUE(is_module_kind(NodeKind::Describe));
  EXPECT_FALSE(is_module_kind(NodeKind::Package));
}

TEST(ModelContextTest, KindNames)
{
  EXPECT_EQ(to_string(NodeKind::ParameterizedType), "ParameterizedType");
  EXPECT_EQ(parse_node_kind("Singleton"), NodeKind::Singleton);
  EXPECT_FALSE(parse_node_kind("Closure").has_value());
  EXPECT_EQ(parse_literal_kind(to_string(LiteralKind::Boolean)), LiteralKind::Boolean);
}

TEST(ModelContextTest, ReferenceableNodes)
{
  ModelContext ctx;
  auto * field = ctx.create<Field>("legs", false);
  auto * param = ctx.create<Parameter>("arg");
  auto * ref = ctx.create<Reference>("legs");
  auto * anonymous = ctx.create<Singleton>();

  EXPECT_TRUE(can_be_referenced(field));
  EXPECT_TRUE(can_be_referenced(param));
  EXPECT_FALSE(can_be_referenced(ref));
  EXPECT_EQ(contributed_name(field), "legs");
  EXPECT_EQ(contributed_name(ref), "");
  EXPECT_EQ(contributed_name(anonymous), "");
}
