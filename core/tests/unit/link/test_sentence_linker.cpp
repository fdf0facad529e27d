// tests/unit/link/test_sentence_linker.cpp - Unit tests for attach_sentence
//

#include <gtest/gtest.h>

#include <string_view>

#include "scopelink/basic/casting.hpp"
#include "scopelink/basic/diagnostic.hpp"
#include "scopelink/link/linker.hpp"
#include "scopelink/link/scope.hpp"
#include "scopelink/link/sentence_linker.hpp"
#include "scopelink/model/json_reader.hpp"
#include "scopelink/model/model_context.hpp"
#include "scopelink/model/traversal.hpp"
#include "scopelink/test_support/model_helpers.hpp"

using namespace scopelink;
using scopelink::test_support::find_all;
using scopelink::test_support::find_named;
using scopelink::test_support::read_model;
using scopelink::test_support::TestModelUnit;

class SentenceLinkerTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    unit_ = read_model(R"({
      "kind": "Package", "name": "repl", "fileName": "repl.src",
      "members": [{"kind": "Program", "name": "session", "body": []}]
    })");
    ASSERT_TRUE(unit_.diags.empty());
    linked_ = link(unit_.packages);
    ASSERT_TRUE(linked_);

    auto * program = find_named<Program>(linked_.environment, "session");
    ASSERT_NE(program, nullptr);
    context_ = program->body;
    ASSERT_NE(context_, nullptr);
  }

  /// Read a sentence into the Environment's context, where attached nodes must live.
  Node * read_sentence(std::string_view json_text)
  {
    ModelReader reader(*linked_.context, diags_, "<repl>");
    Node * sentence = reader.read_sentence_text(json_text);
    EXPECT_TRUE(diags_.empty());
    return sentence;
  }

  TestModelUnit unit_;
  DiagnosticBag diags_;
  LinkedEnvironment linked_;
  Body * context_ = nullptr;
};

TEST_F(SentenceLinkerTest, RegistersTopLevelContribution)
{
  Node * sentence = read_sentence(R"({"kind": "Variable", "name": "x",
    "value": {"kind": "Literal", "value": 1}})");
  ASSERT_NE(sentence, nullptr);

  ASSERT_TRUE(attach_sentence(*sentence, *context_));
  EXPECT_EQ(context_->scope->resolve("x"), sentence);
}

TEST_F(SentenceLinkerTest, StampsEveryAttachedNode)
{
  Node * sentence = read_sentence(R"({"kind": "Return",
    "value": {"kind": "Send", "receiver": {"kind": "Reference", "name": "x"}, "message": "size"}})");
  ASSERT_NE(sentence, nullptr);
  const uint64_t before = linked_.context->ids().high_water_mark();

  ASSERT_TRUE(attach_sentence(*sentence, *context_));

  EXPECT_EQ(sentence->parent, context_);
  walk_preorder(sentence, [&](Node * node, Node * parent) {
    EXPECT_GT(node->id.value, before);
    EXPECT_NE(node->scope, nullptr);
    EXPECT_EQ(node->environment, linked_.environment);
    if (parent != nullptr) {
      EXPECT_EQ(node->parent, parent);
    }
    EXPECT_EQ(linked_.context->node_by_id(node->id), node);
  });
}

TEST_F(SentenceLinkerTest, ScopesChainThroughTheSentence)
{
  Node * sentence = read_sentence(R"({"kind": "Variable", "name": "y",
    "value": {"kind": "Reference", "name": "session"}})");
  ASSERT_TRUE(attach_sentence(*sentence, *context_));

  auto * value = cast<Variable>(sentence)->value;
  ASSERT_NE(value, nullptr);
  EXPECT_EQ(sentence->scope->container(), context_->scope);
  EXPECT_EQ(value->scope->container(), sentence->scope);

  // The attached sentence sees its own name and everything around the context
  EXPECT_EQ(value->scope->resolve("y"), sentence);
  EXPECT_NE(value->scope->resolve("session"), nullptr);
  EXPECT_NE(value->scope->resolve("repl"), nullptr);
}

TEST_F(SentenceLinkerTest, TwoSentencesAreBothVisibleAndIsolated)
{
  Node * first = read_sentence(R"({"kind": "Variable", "name": "a",
    "value": {"kind": "Reference", "name": "a"}})");
  Node * second = read_sentence(R"({"kind": "Variable", "name": "b",
    "value": {"kind": "Reference", "name": "b"}})");
  ASSERT_TRUE(attach_sentence(*first, *context_));
  ASSERT_TRUE(attach_sentence(*second, *context_));

  EXPECT_EQ(context_->scope->resolve("a"), first);
  EXPECT_EQ(context_->scope->resolve("b"), second);

  EXPECT_EQ(second->scope->container(), context_->scope);
  auto refs = find_all<Reference>(first);
  ASSERT_EQ(refs.size(), 1U);
  for (const Scope * s = refs[0]->scope; s != nullptr; s = s->container()) {
    EXPECT_NE(s, second->scope);
  }
}

TEST_F(SentenceLinkerTest, RejectsUnlinkedContext)
{
  Node * sentence = read_sentence(R"({"kind": "Return"})");
  ASSERT_NE(sentence, nullptr);

  EXPECT_FALSE(attach_sentence(*sentence, *unit_.packages[0]));
  EXPECT_FALSE(sentence->id.is_valid());
  EXPECT_EQ(sentence->scope, nullptr);
}

TEST_F(SentenceLinkerTest, RejectsNonSentence)
{
  auto * pkg = linked_.context->create<Package>("loose");

  EXPECT_FALSE(attach_sentence(*pkg, *context_));
  EXPECT_EQ(context_->scope->resolve("loose"), nullptr);
}
