// odx/model/orchestration.cpp
#include "odx/model/orchestration.hpp"

#include <algorithm>

namespace odx
{

ParamDirection parse_param_direction(std::string_view text)
{
  if (text == "In") return ParamDirection::In;
  if (text == "Out") return ParamDirection::Out;
  if (text == "InOut" || text == "Ref") return ParamDirection::InOut;
  return ParamDirection::None;
}

std::string_view to_string(ParamDirection dir)
{
  switch (dir) {
    case ParamDirection::None:
      return "None";
    case ParamDirection::In:
      return "In";
    case ParamDirection::Out:
      return "Out";
    case ParamDirection::InOut:
      return "InOut";
  }
  return "None";
}

OperationKind parse_operation_kind(std::string_view text)
{
  if (text == "OneWay") return OperationKind::OneWay;
  if (text == "RequestResponse") return OperationKind::RequestResponse;
  return OperationKind::Unknown;
}

std::string_view to_string(OperationKind kind)
{
  switch (kind) {
    case OperationKind::OneWay:
      return "OneWay";
    case OperationKind::RequestResponse:
      return "RequestResponse";
    case OperationKind::Unknown:
      return "Unknown";
  }
  return "Unknown";
}

const OperationModel * PortTypeModel::find_operation(std::string_view op_name) const
{
  auto it = std::find_if(operations.begin(), operations.end(), [&](const OperationModel & op) {
    return op.name == op_name;
  });
  return it == operations.end() ? nullptr : &*it;
}

PortDirection derive_port_direction(std::string_view port_modifier, std::string_view signal)
{
  if (port_modifier == "Implements") {
    return signal == "True" ? PortDirection::Receive : PortDirection::ReceiveSend;
  }
  if (port_modifier == "Uses") {
    return signal == "True" ? PortDirection::SendReceive : PortDirection::Send;
  }
  return PortDirection::None;
}

std::string_view to_string(PortDirection dir)
{
  switch (dir) {
    case PortDirection::None:
      return "None";
    case PortDirection::Receive:
      return "Receive";
    case PortDirection::Send:
      return "Send";
    case PortDirection::ReceiveSend:
      return "ReceiveSend";
    case PortDirection::SendReceive:
      return "SendReceive";
  }
  return "None";
}

std::string_view to_string(BindingKind kind)
{
  switch (kind) {
    case BindingKind::Logical:
      return "Logical";
    case BindingKind::Physical:
      return "Physical";
    case BindingKind::Direct:
      return "Direct";
    case BindingKind::Web:
      return "Web";
    case BindingKind::Unknown:
      return "Unknown";
  }
  return "Unknown";
}

// ============================================================================
// OrchestrationModel
// ============================================================================

std::string OrchestrationModel::full_name() const
{
  if (ns.empty()) {
    return name;
  }
  return ns + "." + name;
}

std::string OrchestrationModel::find_message_type(std::string_view logical_name) const
{
  for (const auto & m : messages) {
    if (m.name == logical_name) {
      return m.type;
    }
  }
  return std::string(logical_name);
}

const PortModel * OrchestrationModel::find_port(std::string_view port_name) const
{
  for (const auto & p : ports) {
    if (p.name == port_name) {
      return &p;
    }
  }
  return nullptr;
}

const PortTypeModel * OrchestrationModel::find_port_type(std::string_view type_name) const
{
  for (const auto & pt : port_types) {
    if (pt.name == type_name) {
      return &pt;
    }
  }
  return nullptr;
}

const Shape * OrchestrationModel::find_by_oid(const std::string & oid) const
{
  auto it = oid_index.find(oid);
  if (it == oid_index.end()) {
    return nullptr;
  }
  return &arena.get(it->second);
}

}  // namespace odx
