// test_correlation_resolver.cpp - Unit tests for correlation usage on receives
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "odx/model/orchestration.hpp"
#include "odx/parse/correlation_resolver.hpp"
#include "odx/test_support/odx_builders.hpp"

namespace odx
{

using test_support::El;
using test_support::load_body;

namespace
{

El statement_ref(const std::string & oid, bool initializes)
{
  El ref("StatementRef");
  ref.prop("Ref", oid).prop("Initializes", initializes ? "True" : "False");
  return ref;
}

const ReceivePayload & receive(const test_support::TestLoadUnit & unit, const std::string & oid)
{
  const Shape * s = unit.model.find_by_oid(oid);
  EXPECT_NE(s, nullptr);
  return *s->as<ReceivePayload>();
}

}  // namespace

TEST(CorrelationResolverTest, InitializesAndFollows)
{
  auto unit = load_body({
    El("Receive").oid("r1").prop("Activate", "True"),
    El("Receive").oid("r2"),
    El("CorrelationDeclaration")
      .oid("cd")
      .name("OrderIdSet")
      .prop("Type", "OrderIdType")
      .child(statement_ref("r1", true))
      .child(statement_ref("r2", false)),
  });

  EXPECT_EQ(receive(unit, "r1").initializes_correlation_sets, std::vector<std::string>{"OrderIdSet"});
  EXPECT_TRUE(receive(unit, "r1").follows_correlation_sets.empty());
  EXPECT_EQ(receive(unit, "r2").follows_correlation_sets, std::vector<std::string>{"OrderIdSet"});

  const auto * corr = unit.model.find_by_oid("cd")->as<CorrelationPayload>();
  ASSERT_NE(corr, nullptr);
  EXPECT_EQ(corr->correlation_type, "OrderIdType");
  ASSERT_EQ(corr->statement_refs.size(), 2U);
  EXPECT_TRUE(corr->statement_refs[0].initializes);
}

TEST(CorrelationResolverTest, RepeatedPassAppendsNothing)
{
  auto unit = load_body({
    El("Receive").oid("r2"),
    El("CorrelationDeclaration")
      .oid("cd")
      .name("Set")
      .child(statement_ref("r2", false))
      .child(statement_ref("r2", false)),
  });

  EXPECT_EQ(receive(unit, "r2").follows_correlation_sets.size(), 1U);
  EXPECT_EQ(resolve_correlations(unit.model), 0U);
  EXPECT_EQ(receive(unit, "r2").follows_correlation_sets.size(), 1U);
}

TEST(CorrelationResolverTest, NonReceiveAndUnknownTargetsIgnored)
{
  auto unit = load_body({
    El("Send").oid("s1"),
    El("CorrelationDeclaration")
      .oid("cd")
      .name("Set")
      .child(statement_ref("s1", true))
      .child(statement_ref("missing", true))
      .child(statement_ref("", false)),
  });

  const auto * send = unit.model.find_by_oid("s1");
  ASSERT_NE(send, nullptr);
  EXPECT_EQ(send->kind, ShapeKind::Send);
  EXPECT_EQ(resolve_correlations(unit.model), 0U);
}

TEST(CorrelationResolverTest, ReachesReceivesInsideBranches)
{
  auto unit = load_body({
    El("Listen").oid("li").child(El("Task").child(El("Receive").oid("deep"))),
    El("Scope").oid("sc").child(
      El("CorrelationDeclaration").oid("cd").name("Nested").child(statement_ref("deep", false))),
  });

  EXPECT_EQ(receive(unit, "deep").follows_correlation_sets, std::vector<std::string>{"Nested"});
}

TEST(CorrelationResolverTest, SeveralDeclarationsAccumulate)
{
  auto unit = load_body({
    El("Receive").oid("r"),
    El("CorrelationDeclaration").oid("a").name("First").child(statement_ref("r", false)),
    El("CorrelationDeclaration").oid("b").name("Second").child(statement_ref("r", false)),
  });

  const std::vector<std::string> expected{"First", "Second"};
  EXPECT_EQ(receive(unit, "r").follows_correlation_sets, expected);
}

}  // namespace odx
