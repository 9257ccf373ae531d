// test_branch_resolver.cpp - Unit tests for Decide / Switch / Listen substructure
//
#include <gtest/gtest.h>

#include <string>

#include "odx/model/orchestration.hpp"
#include "odx/test_support/odx_builders.hpp"

namespace odx
{

using test_support::El;
using test_support::load_body;

namespace
{

El branch(const std::string & oid, const std::string & condition = "")
{
  El b("DecisionBranch");
  b.oid(oid);
  if (!condition.empty()) {
    b.prop("Expression", condition);
  }
  return b;
}

}  // namespace

// ============================================================================
// Decide
// ============================================================================

TEST(BranchResolverTest, DecideConditionSelectsTrueBranch)
{
  auto unit = load_body({
    El("Send").oid("s0"),
    El("Decide")
      .oid("dec")
      .name("CheckAmount")
      .child(branch("b1", "Invoice.Amount > 1000").child(El("Send").oid("approve")))
      .child(branch("b2").child(El("Send").oid("auto")).child(El("Send").oid("log"))),
  });

  const Shape & decide = unit.model.shape(unit.model.shapes[1]);
  const auto * p = decide.as<DecidePayload>();
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(p->expression, "Invoice.Amount > 1000");
  ASSERT_EQ(p->true_branch.size(), 1U);
  ASSERT_EQ(p->false_branch.size(), 2U);

  // Branch shapes are re-parented, never generic children
  EXPECT_TRUE(decide.children.empty());
  const Shape & approve = unit.model.shape(p->true_branch[0]);
  ASSERT_TRUE(approve.parent.has_value());
  EXPECT_EQ(*approve.parent, unit.model.shapes[1]);

  // Each branch restarts at zero
  EXPECT_EQ(approve.sequence, 0);
  EXPECT_EQ(approve.unique_key, "approve@body/1:true#0");
  EXPECT_EQ(unit.model.shape(p->false_branch[1]).sequence, 1);
  EXPECT_EQ(unit.model.shape(p->false_branch[1]).unique_key, "log@body/1:false#1");
}

TEST(BranchResolverTest, ReceiveDecideSendKeepsThreeTopLevelShapes)
{
  auto unit = load_body({
    El("Receive").oid("r").prop("Activate", "True"),
    El("Decide").oid("dec").child(branch("a", "X").child(El("Send").oid("inner"))).child(branch("b")),
    El("Send").oid("s"),
  });

  ASSERT_EQ(unit.model.shapes.size(), 3U);
  EXPECT_EQ(unit.model.shape(unit.model.shapes[0]).kind, ShapeKind::Receive);
  EXPECT_EQ(unit.model.shape(unit.model.shapes[2]).oid, "s");
  EXPECT_EQ(unit.model.shape(unit.model.shapes[2]).sequence, 2);

  const auto * p = unit.model.shape(unit.model.shapes[1]).as<DecidePayload>();
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(p->expression, "X");
  ASSERT_EQ(p->true_branch.size(), 1U);
  EXPECT_EQ(unit.model.shape(p->true_branch[0]).oid, "inner");
  EXPECT_TRUE(p->false_branch.empty());
}

TEST(BranchResolverTest, DecideConditionOnLaterBranch)
{
  auto unit = load_body({
    El("Decide")
      .oid("dec")
      .child(branch("else").child(El("Send").oid("no")))
      .child(branch("then").child(El("Expression").prop("Expression", "ok == true")).child(
        El("Send").oid("yes"))),
  });

  const auto * p = unit.model.shape(unit.model.shapes[0]).as<DecidePayload>();
  ASSERT_NE(p, nullptr);
  // nested Expression element of the second branch supplies the condition
  EXPECT_EQ(p->expression, "ok == true");
  ASSERT_EQ(p->true_branch.size(), 2U);
  EXPECT_EQ(unit.model.shape(p->true_branch[1]).oid, "yes");
  ASSERT_EQ(p->false_branch.size(), 1U);
  EXPECT_EQ(unit.model.shape(p->false_branch[0]).oid, "no");
}

TEST(BranchResolverTest, DecidePositionalFallbackUsesSiblingExpression)
{
  auto unit = load_body({
    El("Decide")
      .oid("dec")
      .child(El("Expression").prop("Expression", "x < 3"))
      .child(branch("b1").child(El("Send").oid("first")))
      .child(branch("b2").child(El("Send").oid("second"))),
  });

  const auto * p = unit.model.shape(unit.model.shapes[0]).as<DecidePayload>();
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(p->expression, "x < 3");
  EXPECT_EQ(unit.model.shape(p->true_branch[0]).oid, "first");
  EXPECT_EQ(unit.model.shape(p->false_branch[0]).oid, "second");
}

TEST(BranchResolverTest, DecideFallsBackToExpressionShapeInTrueBranch)
{
  auto unit = load_body({
    El("Decide")
      .oid("dec")
      .child(branch("b1").child(El("Send").oid("s")).child(
        El("Expression").oid("e").prop("Expression", "   ")))
      .child(branch("b2")),
  });

  // Both conditions blank: positional assignment, first Expression shape of
  // the true branch wins even when its own text is blank
  const auto * p = unit.model.shape(unit.model.shapes[0]).as<DecidePayload>();
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(p->true_branch.size(), 2U);
  EXPECT_TRUE(p->false_branch.empty());
  EXPECT_EQ(p->expression, "   ");
}

TEST(BranchResolverTest, DecideWithoutBranches)
{
  auto unit = load_body({
    El("Decision").oid("dec").child(El("Expression").prop("Expression", "flag")),
  });

  const Shape & decide = unit.model.shape(unit.model.shapes[0]);
  const auto * p = decide.as<DecidePayload>();
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(p->expression, "flag");
  EXPECT_TRUE(p->true_branch.empty());
  EXPECT_TRUE(p->false_branch.empty());
  EXPECT_TRUE(decide.children.empty());
}

TEST(BranchResolverTest, DecideIsIndexedBeforeItsBranches)
{
  auto unit = load_body({
    El("Decide").oid("dec").child(branch("b1", "a").child(El("Send").oid("inner"))),
  });

  const ShapeId decide = unit.model.shapes[0];
  const ShapeId inner = unit.model.oid_index.at("inner");
  EXPECT_LT(decide, inner);
  EXPECT_EQ(unit.model.oid_index.at("dec"), decide);
}

TEST(BranchResolverTest, NestedDecideExtendsContextPath)
{
  auto unit = load_body({
    El("Decide").oid("outer").child(
      branch("b1", "a").child(
        El("Decide").oid("inner").child(branch("b2", "b").child(El("Send").oid("deep"))))),
  });

  const Shape * deep = unit.model.find_by_oid("deep");
  ASSERT_NE(deep, nullptr);
  EXPECT_EQ(deep->unique_key, "deep@body/0:true/0:true#0");
}

// ============================================================================
// Switch
// ============================================================================

TEST(BranchResolverTest, SwitchCasesAndDefault)
{
  auto unit = load_body({
    El("Switch")
      .oid("sw")
      .prop("Expression", "Order.Region")
      .child(branch("c1", "\"EU\"").name("Europe").child(El("Send").oid("eu")))
      .child(branch("c2", "\"US\"").name("America").child(El("Send").oid("us")))
      .child(branch("c3", "\"EU\"").name("EuropeAgain").child(El("Send").oid("eu2")))
      .child(branch("c4").name("Fallthrough").child(El("Send").oid("other"))),
  });

  const Shape & sw = unit.model.shape(unit.model.shapes[0]);
  EXPECT_TRUE(sw.children.empty());
  const auto * p = sw.as<SwitchPayload>();
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(p->expression, "Order.Region");
  ASSERT_EQ(p->cases.size(), 2U);
  EXPECT_EQ(p->cases[0].key, "\"EU\"");
  EXPECT_EQ(p->cases[1].key, "\"US\"");

  // duplicate keys concatenate in document order
  const SwitchCase * eu = p->find_case("\"EU\"");
  ASSERT_NE(eu, nullptr);
  ASSERT_EQ(eu->shapes.size(), 2U);
  EXPECT_EQ(unit.model.shape(eu->shapes[1]).oid, "eu2");

  ASSERT_EQ(p->default_case.size(), 1U);
  const Shape & other = unit.model.shape(p->default_case[0]);
  EXPECT_EQ(other.unique_key, "other@body/0:case4#0");
  ASSERT_TRUE(other.parent.has_value());
  EXPECT_EQ(*other.parent, unit.model.shapes[0]);
}

TEST(BranchResolverTest, SwitchDefaultByName)
{
  auto unit = load_body({
    El("Switch")
      .oid("sw")
      .child(El("Expression").prop("Expression", "code"))
      .child(branch("c1", "1").name("Case_Else").child(El("Send").oid("a")))
      .child(branch("c2", "2").name("DEFAULT route").child(El("Send").oid("b")))
      .child(branch("c3", "3").child(El("Send").oid("c"))),
  });

  const auto * p = unit.model.shape(unit.model.shapes[0]).as<SwitchPayload>();
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(p->expression, "code");
  ASSERT_EQ(p->cases.size(), 1U);
  EXPECT_EQ(p->cases[0].key, "3");
  EXPECT_EQ(p->default_case.size(), 2U);
}

TEST(BranchResolverTest, SwitchCaseIgnoresExpressionShapeInBody)
{
  auto unit = load_body({
    El("Switch")
      .oid("sw")
      .prop("Expression", "Order.Region")
      .child(branch("c1", "\"EU\"").child(El("Send").oid("eu")))
      .child(branch("c2")
               .name("Otherwise")
               .child(El("Expression").oid("x").prop("Expression", "log()"))
               .child(El("Send").oid("rest"))),
  });

  const auto * p = unit.model.shape(unit.model.shapes[0]).as<SwitchPayload>();
  ASSERT_NE(p, nullptr);
  ASSERT_EQ(p->cases.size(), 1U);
  EXPECT_EQ(p->cases[0].key, "\"EU\"");
  EXPECT_EQ(p->find_case("log()"), nullptr);
  ASSERT_EQ(p->default_case.size(), 2U);
  EXPECT_EQ(unit.model.shape(p->default_case[0]).shape_type, "Expression");
  EXPECT_EQ(unit.model.shape(p->default_case[1]).oid, "rest");
}

// ============================================================================
// Listen
// ============================================================================

TEST(BranchResolverTest, ListenBranchesFromTaskAndListenBranch)
{
  auto unit = load_body({
    El("Listen")
      .oid("li")
      .child(El("Task").child(El("Receive").oid("r1").prop("Activate", "True")))
      .child(El("ListenBranch").child(El("Delay").oid("d1")).child(El("Send").oid("s1")))
      .child(El("Send").oid("ignored")),
  });

  const Shape & listen = unit.model.shape(unit.model.shapes[0]);
  EXPECT_TRUE(listen.children.empty());
  const auto * p = listen.as<ListenPayload>();
  ASSERT_NE(p, nullptr);
  ASSERT_EQ(p->branches.size(), 3U);

  const Shape & r1 = unit.model.shape(p->branches[0]);
  EXPECT_EQ(r1.unique_key, "r1@body/0:listen1#0");
  const Shape & s1 = unit.model.shape(p->branches[2]);
  EXPECT_EQ(s1.sequence, 1);
  EXPECT_EQ(s1.unique_key, "s1@body/0:listen2#1");
  ASSERT_TRUE(s1.parent.has_value());
  EXPECT_EQ(*s1.parent, unit.model.shapes[0]);

  // shapes outside a branch container are not parsed
  EXPECT_EQ(unit.model.find_by_oid("ignored"), nullptr);
}

}  // namespace odx
