// odx/model/model_json.cpp - JSON serialization implementation
//
#include "odx/model/model_json.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace odx
{
namespace
{

using nlohmann::json;

json j_shape(const OrchestrationModel & model, ShapeId id);

json j_shapes(const OrchestrationModel & model, const std::vector<ShapeId> & ids)
{
  json arr = json::array();
  for (ShapeId id : ids) {
    arr.push_back(j_shape(model, id));
  }
  return arr;
}

// ============================================================================
// Payloads
// ============================================================================

void add_payload(const OrchestrationModel & model, const Shape & s, json & j)
{
  if (const auto * p = s.as<ReceivePayload>()) {
    j["portName"] = p->port_name;
    j["messageName"] = p->message_name;
    j["operationName"] = p->operation_name;
    j["operationMessageName"] = p->operation_message_name;
    j["activate"] = p->activate;
    j["initializesCorrelationSets"] = p->initializes_correlation_sets;
    j["followsCorrelationSets"] = p->follows_correlation_sets;
  } else if (const auto * p = s.as<SendPayload>()) {
    j["portName"] = p->port_name;
    j["messageName"] = p->message_name;
    j["operationName"] = p->operation_name;
    j["operationMessageName"] = p->operation_message_name;
  } else if (const auto * p = s.as<ConstructPayload>()) {
    j["constructedMessages"] = p->constructed_messages;
    j["innerShapes"] = j_shapes(model, p->inner_shapes);
  } else if (const auto * p = s.as<TransformPayload>()) {
    j["className"] = p->class_name;
    j["inputMessages"] = p->input_messages;
    j["outputMessages"] = p->output_messages;
  } else if (const auto * p = s.as<ExpressionPayload>()) {
    j["expression"] = p->expression;
  } else if (const auto * p = s.as<LoopPayload>()) {
    j["loopType"] = p->loop_type;
    j["collectionExpression"] = p->collection_expression;
    j["itemVariable"] = p->item_variable;
  } else if (const auto * p = s.as<InvokePayload>()) {
    j["invokee"] = p->invokee;
  } else if (const auto * p = s.as<CorrelationPayload>()) {
    j["correlationType"] = p->correlation_type;
    json refs = json::array();
    for (const auto & r : p->statement_refs) {
      refs.push_back(json{{"statementOid", r.statement_oid}, {"initializes", r.initializes}});
    }
    j["statementRefs"] = std::move(refs);
  } else if (const auto * p = s.as<DecidePayload>()) {
    j["expression"] = p->expression;
    j["trueBranch"] = j_shapes(model, p->true_branch);
    j["falseBranch"] = j_shapes(model, p->false_branch);
  } else if (const auto * p = s.as<SwitchPayload>()) {
    j["expression"] = p->expression;
    json cases = json::array();
    for (const auto & c : p->cases) {
      cases.push_back(json{{"key", c.key}, {"shapes", j_shapes(model, c.shapes)}});
    }
    j["cases"] = std::move(cases);
    j["defaultCase"] = j_shapes(model, p->default_case);
  } else if (const auto * p = s.as<ListenPayload>()) {
    j["branches"] = j_shapes(model, p->branches);
  } else if (const auto * p = s.as<TerminatePayload>()) {
    j["errorMessage"] = p->error_message;
  } else if (const auto * p = s.as<DelayPayload>()) {
    j["delayExpression"] = p->delay_expression;
  } else if (const auto * p = s.as<CompensatePayload>()) {
    j["target"] = p->target;
  } else if (const auto * p = s.as<CatchPayload>()) {
    j["exceptionType"] = p->exception_type;
    j["exceptionVariable"] = p->exception_variable;
  } else if (const auto * p = s.as<VariableDeclarationPayload>()) {
    j["varType"] = p->var_type;
    j["useDefault"] = p->use_default;
  } else if (const auto * p = s.as<CallRulesPayload>()) {
    j["policyName"] = p->policy_name;
  } else if (const auto * p = s.as<FallbackPayload>()) {
    j["kindName"] = p->kind_name;
    j["details"] = p->details;
  }
}

json j_shape(const OrchestrationModel & model, ShapeId id)
{
  const Shape & s = model.shape(id);
  json j{
    {"kind", std::string(to_string(s.kind))},
    {"shapeType", s.shape_type},
    {"name", s.name},
    {"oid", s.oid},
    {"sequence", s.sequence},
    {"uniqueKey", s.unique_key}};
  add_payload(model, s, j);
  if (!s.children.empty()) {
    j["children"] = j_shapes(model, s.children);
  }
  return j;
}

// ============================================================================
// Declarations
// ============================================================================

json j_message(const MessageModel & m)
{
  return json{
    {"name", m.name}, {"type", m.type}, {"direction", std::string(to_string(m.direction))}};
}

json j_port_type(const PortTypeModel & pt)
{
  json ops = json::array();
  for (const auto & op : pt.operations) {
    json jo{
      {"name", op.name},
      {"operationType", op.operation_type},
      {"kind", std::string(to_string(op.kind))}};
    if (!op.request_message_type.empty()) jo["request"] = op.request_message_type;
    if (!op.response_message_type.empty()) jo["response"] = op.response_message_type;
    if (!op.fault_message_type.empty()) jo["fault"] = op.fault_message_type;
    ops.push_back(std::move(jo));
  }
  return json{{"name", pt.name}, {"modifier", pt.modifier}, {"operations", std::move(ops)}};
}

json j_port(const PortModel & p)
{
  json j{
    {"name", p.name},
    {"portType", p.port_type},
    {"direction", std::string(to_string(p.direction))},
    {"bindingKind", std::string(to_string(p.binding_kind))},
    {"adapterName", p.adapter_name},
    {"transportType", p.transport_type}};
  if (!p.address.empty()) j["address"] = p.address;
  if (p.polling_interval_seconds) j["pollingIntervalSeconds"] = *p.polling_interval_seconds;
  return j;
}

}  // namespace

json to_json(const OrchestrationModel & model, ShapeId id) { return j_shape(model, id); }

json to_json(const OrchestrationModel & model)
{
  json messages = json::array();
  for (const auto & m : model.messages) messages.push_back(j_message(m));

  json port_types = json::array();
  for (const auto & pt : model.port_types) port_types.push_back(j_port_type(pt));

  json ports = json::array();
  for (const auto & p : model.ports) ports.push_back(j_port(p));

  return json{
    {"namespace", model.ns},
    {"name", model.name},
    {"fullName", model.full_name()},
    {"messages", std::move(messages)},
    {"portTypes", std::move(port_types)},
    {"ports", std::move(ports)},
    {"shapes", j_shapes(model, model.shapes)}};
}

}  // namespace odx
