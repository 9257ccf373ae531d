// test_model_json.cpp - Unit tests for model JSON serialization
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "odx/model/model_json.hpp"
#include "odx/test_support/odx_builders.hpp"

using nlohmann::json;

namespace odx
{

using test_support::El;

class ModelJsonTest : public ::testing::Test
{
protected:
  static json load_and_serialize(const std::vector<El> & body)
  {
    auto unit = test_support::load_body(body);
    return to_json(unit.model);
  }
};

TEST_F(ModelJsonTest, EmptyBody)
{
  auto j = load_and_serialize({});
  EXPECT_EQ(j["namespace"], "Contoso.Billing");
  EXPECT_EQ(j["name"], "ProcessInvoice");
  EXPECT_EQ(j["fullName"], "Contoso.Billing.ProcessInvoice");
  EXPECT_TRUE(j["shapes"].is_array());
  EXPECT_EQ(j["shapes"].size(), 0);
  EXPECT_TRUE(j["messages"].is_array());
  EXPECT_TRUE(j["ports"].is_array());
}

TEST_F(ModelJsonTest, ReceiveHeaderAndPayload)
{
  auto j = load_and_serialize({
    El("Receive").oid("r1").name("ReceiveOrder").prop("Activate", "True").prop(
      "MessageName", "OrderMsg"),
  });

  ASSERT_EQ(j["shapes"].size(), 1);
  auto recv = j["shapes"][0];
  EXPECT_EQ(recv["kind"], "receive");
  EXPECT_EQ(recv["shapeType"], "Receive");
  EXPECT_EQ(recv["name"], "ReceiveOrder");
  EXPECT_EQ(recv["oid"], "r1");
  EXPECT_EQ(recv["sequence"], 0);
  EXPECT_EQ(recv["uniqueKey"], "r1@body#0");
  EXPECT_EQ(recv["activate"], true);
  EXPECT_EQ(recv["messageName"], "OrderMsg");
  EXPECT_TRUE(recv["initializesCorrelationSets"].is_array());
  EXPECT_FALSE(recv.contains("children"));
}

TEST_F(ModelJsonTest, DecideBranchesExpandInPlace)
{
  auto j = load_and_serialize({
    El("Decide").oid("d").child(
      El("DecisionBranch").prop("Expression", "x > 1").child(El("Send").oid("s1").name("Yes"))),
  });

  auto decide = j["shapes"][0];
  EXPECT_EQ(decide["kind"], "decide");
  EXPECT_EQ(decide["expression"], "x > 1");
  ASSERT_EQ(decide["trueBranch"].size(), 1);
  EXPECT_EQ(decide["trueBranch"][0]["name"], "Yes");
  EXPECT_EQ(decide["falseBranch"].size(), 0);
  EXPECT_FALSE(decide.contains("children"));
}

TEST_F(ModelJsonTest, SwitchCasesKeepOrder)
{
  auto j = load_and_serialize({
    El("Switch")
      .oid("sw")
      .prop("Expression", "code")
      .child(El("DecisionBranch").prop("Expression", "2").child(El("Send").oid("a")))
      .child(El("DecisionBranch").prop("Expression", "1").child(El("Send").oid("b")))
      .child(El("DecisionBranch").name("Default").child(El("Send").oid("c"))),
  });

  auto sw = j["shapes"][0];
  ASSERT_EQ(sw["cases"].size(), 2);
  EXPECT_EQ(sw["cases"][0]["key"], "2");
  EXPECT_EQ(sw["cases"][1]["key"], "1");
  ASSERT_EQ(sw["defaultCase"].size(), 1);
  EXPECT_EQ(sw["defaultCase"][0]["oid"], "c");
}

TEST_F(ModelJsonTest, GenericChildrenNested)
{
  auto j = load_and_serialize({
    El("Scope").oid("sc").name("Tx").child(El("Catch").oid("c").child(El("Terminate").oid("t"))),
  });

  auto scope = j["shapes"][0];
  ASSERT_TRUE(scope.contains("children"));
  auto katch = scope["children"][0];
  EXPECT_EQ(katch["exceptionType"], "System.Exception");
  EXPECT_EQ(katch["children"][0]["kind"], "terminate");
}

TEST_F(ModelJsonTest, PortsAndOperations)
{
  test_support::OdxSource src;
  src.module_items = {El("PortType").name("PT").child(
    El("OperationDeclaration").name("Op").prop("OperationType", "OneWay").child(
      El("MessageRef").prop("Name", "Request").prop("Ref", "Req")))};
  src.service_items = {El("PortDeclaration").name("In").prop("Type", "PT").prop(
    "PortModifier", "Implements")};
  auto unit = test_support::load(src);
  auto j = to_json(unit.model);

  auto op = j["portTypes"][0]["operations"][0];
  EXPECT_EQ(op["kind"], "OneWay");
  EXPECT_EQ(op["request"], "Req");
  EXPECT_FALSE(op.contains("response"));

  auto port = j["ports"][0];
  EXPECT_EQ(port["direction"], "ReceiveSend");
  EXPECT_EQ(port["bindingKind"], "Unknown");
  EXPECT_FALSE(port.contains("address"));
}

TEST_F(ModelJsonTest, SingleShapeSubtree)
{
  auto unit = test_support::load_body({El("Group").oid("g").child(El("Send").oid("s"))});
  auto j = to_json(unit.model, unit.model.shapes[0]);
  EXPECT_EQ(j["kind"], "group");
  EXPECT_EQ(j["children"].size(), 1);
}

}  // namespace odx
