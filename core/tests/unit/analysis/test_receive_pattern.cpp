// test_receive_pattern.cpp - Unit tests for activating-receive classification
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "odx/analysis/receive_pattern.hpp"
#include "odx/test_support/odx_builders.hpp"

namespace odx
{

using test_support::El;

namespace
{

El activating(const std::string & oid)
{
  El e("Receive");
  e.oid(oid).name("Receive_" + oid).prop("Activate", "True");
  return e;
}

El statement_ref(const std::string & oid, bool initializes)
{
  El ref("StatementRef");
  ref.prop("Ref", oid).prop("Initializes", initializes ? "True" : "False");
  return ref;
}

ReceivePatternAnalysis classify(const std::vector<El> & body)
{
  auto unit = test_support::load_body(body);
  return analyze_receive_pattern(unit.model);
}

}  // namespace

TEST(ReceivePatternTest, NoActivatingReceiveIsCallable)
{
  auto a = classify({El("Receive").oid("r"), El("Send").oid("s")});
  EXPECT_EQ(a.pattern, ReceivePattern::Callable);
  EXPECT_TRUE(a.requires_request_trigger);
  EXPECT_TRUE(a.is_valid());
  EXPECT_FALSE(a.primary_receive.has_value());
  EXPECT_EQ(a.total_receive_count(), 0U);
  ASSERT_EQ(a.migration_warnings.size(), 1U);
  EXPECT_NE(a.migration_warnings[0].find("HTTP Request trigger"), std::string::npos);
}

TEST(ReceivePatternTest, SingleTrigger)
{
  auto a = classify({activating("r1"), El("Receive").oid("r2")});
  EXPECT_EQ(a.pattern, ReceivePattern::SingleTrigger);
  ASSERT_TRUE(a.primary_receive.has_value());
  EXPECT_TRUE(a.secondary_receives.empty());
  EXPECT_TRUE(a.migration_warnings.empty());
  EXPECT_TRUE(a.is_valid());
}

TEST(ReceivePatternTest, ConvoyWhenFollowersExist)
{
  auto a = classify({
    activating("r1"),
    El("Receive").oid("r2"),
    El("Receive").oid("r3"),
    El("CorrelationDeclaration")
      .oid("cd")
      .name("OrderSet")
      .child(statement_ref("r1", true))
      .child(statement_ref("r2", false)),
  });

  EXPECT_EQ(a.pattern, ReceivePattern::Convoy);
  EXPECT_TRUE(a.requires_session_support);
  ASSERT_EQ(a.secondary_receives.size(), 1U);
  EXPECT_EQ(a.total_receive_count(), 2U);
  ASSERT_EQ(a.migration_warnings.size(), 1U);
  EXPECT_NE(a.migration_warnings[0].find("1 correlated receive(s)"), std::string::npos);
}

TEST(ReceivePatternTest, InitializingWithoutFollowersStaysSingle)
{
  auto a = classify({
    activating("r1"),
    El("CorrelationDeclaration").oid("cd").name("OrderSet").child(statement_ref("r1", true)),
  });
  EXPECT_EQ(a.pattern, ReceivePattern::SingleTrigger);
}

TEST(ReceivePatternTest, ListenFirstToComplete)
{
  auto a = classify({
    El("Listen")
      .oid("l")
      .child(El("Task").child(activating("a")))
      .child(El("Task").child(activating("b"))),
  });

  EXPECT_EQ(a.pattern, ReceivePattern::ListenFirstToComplete);
  EXPECT_TRUE(a.requires_timeout_handling);
  EXPECT_TRUE(a.is_valid());
  EXPECT_EQ(a.total_receive_count(), 2U);
  ASSERT_EQ(a.migration_warnings.size(), 1U);
  EXPECT_NE(a.migration_warnings[0].find("Listen shape with 2 activating receives"), std::string::npos);
}

TEST(ReceivePatternTest, ParallelAllMustCompleteIsInvalid)
{
  auto a = classify({
    El("Parallel")
      .oid("p")
      .child(El("ParallelBranch").child(activating("a")))
      .child(El("ParallelBranch").child(activating("b"))),
  });

  EXPECT_EQ(a.pattern, ReceivePattern::ParallelAllMustComplete);
  EXPECT_FALSE(a.is_valid());
  EXPECT_EQ(a.migration_error.rfind("INVALID PATTERN: 2 activating Receive shapes in Parallel", 0), 0U);
}

TEST(ReceivePatternTest, SequentialActivatingReceivesAreInvalid)
{
  auto a = classify({activating("a"), El("Send").oid("s"), activating("b")});
  EXPECT_EQ(a.pattern, ReceivePattern::Invalid);
  EXPECT_FALSE(a.is_valid());
  EXPECT_NE(a.migration_error.find("2 sequential activating Receive shapes"), std::string::npos);
  ASSERT_EQ(a.secondary_receives.size(), 1U);
}

TEST(ReceivePatternTest, DifferentListensAreNotFirstToComplete)
{
  auto a = classify({
    El("Listen").oid("l1").child(El("Task").child(activating("a"))),
    El("Listen").oid("l2").child(El("Task").child(activating("b"))),
  });
  EXPECT_EQ(a.pattern, ReceivePattern::Invalid);
}

TEST(ReceivePatternTest, PatternNames)
{
  EXPECT_EQ(to_string(ReceivePattern::Convoy), "Convoy");
  EXPECT_EQ(to_string(ReceivePattern::ListenFirstToComplete), "ListenFirstToComplete");
}

}  // namespace odx
