// odx/parse/shape_parser.cpp - Recursive-descent builder of the shape tree
#include "odx/parse/shape_parser.hpp"

#include <cctype>
#include <initializer_list>
#include <string>
#include <utility>

#include "odx/basic/string_utils.hpp"
#include "odx/parse/branch_resolver.hpp"
#include "tinyxml2.h"

namespace odx
{

namespace
{

constexpr size_t k_max_policy_segment = 40;

// Dispatch entry; an empty `reported` keeps the source Type as shape type
struct KindEntry
{
  std::string_view type;
  ShapeKind kind;
  std::string_view reported;
};

// clang-format off
constexpr KindEntry k_dispatch[] = {
  {"Receive",                ShapeKind::Receive,                {}},
  {"Send",                   ShapeKind::Send,                   {}},
  {"Construct",              ShapeKind::Construct,              "Construct"},
  {"Transform",              ShapeKind::Transform,              "Transform"},
  {"MessageAssignment",      ShapeKind::MessageAssignment,      {}},
  {"VariableAssignment",     ShapeKind::VariableAssignment,     {}},
  {"While",                  ShapeKind::While,                  {}},
  {"Until",                  ShapeKind::Until,                  {}},
  {"Loop",                   ShapeKind::Loop,                   {}},
  {"ForEach",                ShapeKind::Loop,                   {}},
  {"Call",                   ShapeKind::Call,                   "Call"},
  {"Exec",                   ShapeKind::Start,                  "StartOrchestration"},
  {"Start",                  ShapeKind::Start,                  "StartOrchestration"},
  {"StartOrchestration",     ShapeKind::Start,                  "StartOrchestration"},
  {"CorrelationDeclaration", ShapeKind::CorrelationDeclaration, {}},
  {"Decision",               ShapeKind::Decide,                 "Decide"},
  {"Decide",                 ShapeKind::Decide,                 "Decide"},
  {"If",                     ShapeKind::Decide,                 "Decide"},
  {"IfElse",                 ShapeKind::Decide,                 "Decide"},
  {"Switch",                 ShapeKind::Switch,                 "Switch"},
  {"Listen",                 ShapeKind::Listen,                 "Listen"},
  {"Scope",                  ShapeKind::Scope,                  {}},
  {"Group",                  ShapeKind::Group,                  {}},
  {"Parallel",               ShapeKind::Parallel,               {}},
  {"ParallelBranch",         ShapeKind::ParallelBranch,         {}},
  {"Task",                   ShapeKind::Task,                   {}},
  {"Throw",                  ShapeKind::Terminate,              {}},
  {"Suspend",                ShapeKind::Terminate,              {}},
  {"Terminate",              ShapeKind::Terminate,              {}},
  {"Expression",             ShapeKind::Expression,             {}},
  {"Delay",                  ShapeKind::Delay,                  {}},
  {"Compensate",             ShapeKind::Compensate,             {}},
  {"Catch",                  ShapeKind::Catch,                  {}},
  {"CatchException",         ShapeKind::Catch,                  {}},
  {"Compensation",           ShapeKind::Compensation,           {}},
  {"AtomicTransaction",      ShapeKind::AtomicTransaction,      {}},
  {"LongRunningTransaction", ShapeKind::LongRunningTransaction, {}},
  {"VariableDeclaration",    ShapeKind::VariableDeclaration,    "VariableDeclaration"},
  {"MessageDeclaration",     ShapeKind::VariableDeclaration,    "VariableDeclaration"},
};
// clang-format on

const KindEntry * lookup_kind(std::string_view type)
{
  for (const auto & entry : k_dispatch) {
    if (entry.type == type) {
      return &entry;
    }
  }
  return nullptr;
}

bool is_call_rules_type(std::string_view type)
{
  return iequals(type, "CallRules") || iequals(type, "CallPolicy");
}

// Kinds whose raw children are not parsed as generic children
bool skips_generic_recursion(ShapeKind kind)
{
  switch (kind) {
    case ShapeKind::Decide:
    case ShapeKind::Switch:
    case ShapeKind::Listen:
    case ShapeKind::Construct:
    case ShapeKind::MessageAssignment:
      return true;
    default:
      return false;
  }
}

std::string first_non_empty(std::initializer_list<std::string> values, std::string fallback = {})
{
  for (const auto & v : values) {
    if (!v.empty()) {
      return v;
    }
  }
  return fallback;
}

uint32_t line_of(const tinyxml2::XMLElement * element)
{
  return element ? static_cast<uint32_t>(element->GetLineNum()) : 0;
}

}  // namespace

// ============================================================================
// ParserState
// ============================================================================

ParserState ParserState::nested(std::string_view suffix) const
{
  ParserState child(arena, oid_index, context_path + std::string(suffix), diags);
  return child;
}

void ParserState::register_oid(const std::string & oid, ShapeId id)
{
  if (oid.empty()) {
    return;
  }
  const auto [it, inserted] = oid_index.emplace(oid, id);
  if (inserted || diags == nullptr) {
    return;
  }
  diags->report_warning(arena.get(id).line, "duplicate identifier '" + oid + "'", "ignored for lookups")
    .with_code("P002")
    .with_secondary_label(arena.get(it->second).line, "first registered here");
}

std::string ParserState::make_key(std::string_view oid, int seq) const
{
  std::string key(oid);
  key += '@';
  key += context_path;
  key += '#';
  key += std::to_string(seq);
  return key;
}

// ============================================================================
// Policy helpers
// ============================================================================

std::string safe_policy_segment(std::string_view policy)
{
  std::string out;
  for (char c : policy) {
    if (std::isalnum(static_cast<unsigned char>(c)) != 0) {
      out.push_back(c);
      if (out.size() == k_max_policy_segment) {
        break;
      }
    }
  }
  return out;
}

std::string call_rules_name(std::string_view policy)
{
  const std::string segment = safe_policy_segment(policy);
  if (segment.empty()) {
    return "Execute_Rules_Engine";
  }
  return "Execute_Rules_Engine_" + segment;
}

// ============================================================================
// Traversal
// ============================================================================

std::vector<ShapeId> ShapeParser::parse_context(
  const tinyxml2::XMLElement * container, ParserState & state)
{
  std::vector<ShapeId> roots;
  parse_elements(container, state, std::nullopt, &roots);
  return roots;
}

void ShapeParser::parse_children(
  const tinyxml2::XMLElement * container, ParserState & state, ShapeId parent)
{
  parse_elements(container, state, parent, nullptr);
}

void ShapeParser::parse_elements(
  const tinyxml2::XMLElement * container, ParserState & state, std::optional<ShapeId> parent,
  std::vector<ShapeId> * roots)
{
  if (container == nullptr) {
    return;
  }
  for (const auto * child : reader_.child_elements(container)) {
    auto id = parse_shape(child, state, parent);
    if (id && roots != nullptr) {
      roots->push_back(*id);
    }
  }
}

std::optional<ShapeId> ShapeParser::parse_shape(
  const tinyxml2::XMLElement * element, ParserState & state, std::optional<ShapeId> parent)
{
  const std::string type = ElementReader::type_of(element);

  if (type == "TransactionAttribute") {
    return std::nullopt;
  }

  Shape shape;
  if (is_call_rules_type(type)) {
    shape = build_call_rules(element);
  } else if (const auto * entry = lookup_kind(type)) {
    shape = build_shape(element, type, entry->kind, entry->reported);
  } else {
    shape = build_shape(element, type, ShapeKind::Fallback, {});
    if (state.diags != nullptr) {
      state.diags
        ->report_warning(
          line_of(element), "unknown shape type '" + type + "'", "kept as a fallback node")
        .with_code("P001");
    }
  }

  shape.sequence = state.next_sequence();
  shape.unique_key = state.make_key(shape.oid, shape.sequence);
  shape.line = line_of(element);

  const ShapeKind kind = shape.kind;
  const std::string oid = shape.oid;
  const ShapeId id = state.arena.create(std::move(shape));
  if (parent) {
    state.arena.attach_child(*parent, id);
  }
  state.register_oid(oid, id);

  switch (kind) {
    case ShapeKind::Decide: {
      BranchResolver resolver(*this);
      resolver.resolve_decide(element, state, id);
      break;
    }
    case ShapeKind::Switch: {
      BranchResolver resolver(*this);
      resolver.resolve_switch(element, state, id);
      break;
    }
    case ShapeKind::Listen: {
      BranchResolver resolver(*this);
      resolver.resolve_listen(element, state, id);
      break;
    }
    case ShapeKind::Construct:
      parse_construct_payload(element, state, id);
      break;
    default:
      break;
  }

  if (!skips_generic_recursion(kind)) {
    parse_children(element, state, id);
  }
  return id;
}

// ============================================================================
// Builders
// ============================================================================

Shape ShapeParser::build_shape(
  const tinyxml2::XMLElement * element, const std::string & type, ShapeKind kind,
  std::string_view reported_type) const
{
  Shape shape;
  shape.oid = ElementReader::oid_of(element);
  shape.name = reader_.property(element, "Name");
  shape.kind = kind;
  shape.shape_type = reported_type.empty() ? type : std::string(reported_type);

  switch (kind) {
    case ShapeKind::Receive: {
      ReceivePayload p;
      p.port_name = reader_.property(element, "PortName");
      p.message_name = reader_.property(element, "MessageName");
      p.operation_name = reader_.property(element, "OperationName");
      p.operation_message_name = reader_.property(element, "OperationMessageName");
      p.activate = reader_.property(element, "Activate") == "True";
      shape.payload = std::move(p);
      break;
    }
    case ShapeKind::Send: {
      SendPayload p;
      p.port_name = reader_.property(element, "PortName");
      p.message_name = reader_.property(element, "MessageName");
      p.operation_name = reader_.property(element, "OperationName");
      p.operation_message_name = reader_.property(element, "OperationMessageName");
      shape.payload = std::move(p);
      break;
    }
    case ShapeKind::Construct: {
      ConstructPayload p;
      for (const auto * ref : reader_.select(element, "MessageRef")) {
        std::string value = reader_.property(ref, "Ref");
        if (!value.empty()) {
          p.constructed_messages.push_back(std::move(value));
        }
      }
      shape.payload = std::move(p);
      break;
    }
    case ShapeKind::Transform: {
      Shape t = build_transform(element);
      shape.payload = std::move(t.payload);
      break;
    }
    case ShapeKind::MessageAssignment:
    case ShapeKind::VariableAssignment:
    case ShapeKind::Expression:
    case ShapeKind::While:
    case ShapeKind::Until:
      shape.payload = ExpressionPayload{reader_.property(element, "Expression")};
      break;
    case ShapeKind::Loop: {
      LoopPayload p;
      p.loop_type = type;
      p.collection_expression = reader_.eval(element, "Expression", "Expression");
      p.item_variable = first_non_empty({reader_.eval(element, "IteratorVariable", "Name")}, "item");
      shape.payload = std::move(p);
      break;
    }
    case ShapeKind::Call:
    case ShapeKind::Start:
      shape.payload = InvokePayload{reader_.property(element, "Invokee")};
      break;
    case ShapeKind::CorrelationDeclaration: {
      CorrelationPayload p;
      p.correlation_type = reader_.property(element, "Type");
      for (const auto * ref : reader_.select(element, "StatementRef")) {
        StatementRef sr;
        sr.statement_oid = reader_.property(ref, "Ref");
        sr.initializes = reader_.property(ref, "Initializes") == "True";
        p.statement_refs.push_back(std::move(sr));
      }
      shape.payload = std::move(p);
      break;
    }
    case ShapeKind::Decide:
      shape.payload = DecidePayload{};
      break;
    case ShapeKind::Switch:
      shape.payload = SwitchPayload{};
      break;
    case ShapeKind::Listen:
      shape.payload = ListenPayload{};
      if (shape.name.empty()) shape.name = "Listen";
      break;
    case ShapeKind::Task:
      if (shape.name.empty()) shape.name = "Task";
      break;
    case ShapeKind::ParallelBranch:
      if (shape.name.empty()) shape.name = "ParallelBranch";
      break;
    case ShapeKind::Terminate: {
      TerminatePayload p;
      if (type == "Throw") {
        p.error_message = first_non_empty(
          {reader_.property(element, "Exception"), reader_.property(element, "ExceptionType")});
      } else if (type == "Suspend") {
        p.error_message = first_non_empty({reader_.property(element, "ErrorMessage")}, "Suspended");
      } else {
        p.error_message = reader_.property(element, "ErrorMessage");
      }
      shape.payload = std::move(p);
      break;
    }
    case ShapeKind::Delay:
      shape.payload = DelayPayload{reader_.property(element, "Expression")};
      break;
    case ShapeKind::Compensate:
      shape.payload = CompensatePayload{reader_.property(element, "Target")};
      break;
    case ShapeKind::Catch: {
      CatchPayload p;
      p.exception_type = first_non_empty(
        {reader_.property(element, "ExceptionType"), reader_.property(element, "Exception")},
        "System.Exception");
      p.exception_variable = first_non_empty(
        {reader_.property(element, "ExceptionName"), reader_.property(element, "ExceptionVariable")},
        "ex");
      shape.payload = std::move(p);
      break;
    }
    case ShapeKind::VariableDeclaration: {
      VariableDeclarationPayload p;
      p.var_type = reader_.property(element, "Type");
      if (type == "VariableDeclaration") {
        p.use_default = reader_.property(element, "UseDefaultConstructor");
      }
      shape.payload = std::move(p);
      break;
    }
    case ShapeKind::Fallback: {
      FallbackPayload p;
      p.kind_name = type;
      p.details = "Unhandled shape type: " + type;
      shape.payload = std::move(p);
      if (shape.shape_type.empty()) {
        shape.shape_type = "Unknown";
      }
      if (shape.name.empty()) {
        shape.name = "Unknown_" + type;
      }
      break;
    }
    default:
      break;
  }
  return shape;
}

Shape ShapeParser::build_call_rules(const tinyxml2::XMLElement * element) const
{
  Shape shape;
  shape.oid = ElementReader::oid_of(element);
  shape.kind = ShapeKind::CallRules;
  shape.shape_type = ElementReader::type_of(element);

  CallRulesPayload p;
  p.policy_name = first_non_empty(
    {reader_.property(element, "Policy"), reader_.property(element, "PolicyName"),
     reader_.property(element, "Ruleset")});
  shape.name = call_rules_name(p.policy_name);
  shape.payload = std::move(p);
  return shape;
}

Shape ShapeParser::build_transform(const tinyxml2::XMLElement * element) const
{
  Shape shape;
  shape.oid = ElementReader::oid_of(element);
  shape.name = reader_.property(element, "Name");
  shape.kind = ShapeKind::Transform;
  shape.shape_type = "Transform";

  TransformPayload p;
  p.class_name = reader_.property(element, "ClassName");

  std::vector<std::string> refs;
  for (const auto * part : reader_.select(element, "MessagePartRef")) {
    std::string value = reader_.property(part, "MessageRef");
    if (!value.empty()) {
      refs.push_back(std::move(value));
    }
  }
  if (refs.size() == 2) {
    p.input_messages.push_back(refs[0]);
    p.output_messages.push_back(refs[1]);
  } else {
    p.input_messages = refs;
  }
  shape.payload = std::move(p);
  return shape;
}

void ShapeParser::parse_construct_payload(
  const tinyxml2::XMLElement * element, ParserState & state, ShapeId construct)
{
  const int seq = state.arena.get(construct).sequence;
  const std::string inner_path =
    state.context_path + "/" + std::to_string(seq) + ":inner";

  std::vector<ShapeId> inner;
  auto add_inner = [&](Shape shape, const tinyxml2::XMLElement * source) {
    shape.sequence = seq;
    shape.line = line_of(source);
    shape.unique_key = shape.oid + "@" + inner_path + std::to_string(inner.size()) + "#" +
                       std::to_string(seq);
    const std::string oid = shape.oid;
    const ShapeId id = state.arena.create(std::move(shape));
    state.arena.set_parent(id, construct);
    state.register_oid(oid, id);
    inner.push_back(id);
  };

  for (const auto * t : reader_.select(element, "Transform")) {
    add_inner(build_transform(t), t);
  }
  for (const auto * a : reader_.select(element, "MessageAssignment")) {
    Shape shape;
    shape.oid = ElementReader::oid_of(a);
    shape.name = reader_.property(a, "Name");
    shape.kind = ShapeKind::MessageAssignment;
    shape.shape_type = "MessageAssignment";
    shape.payload = ExpressionPayload{reader_.property(a, "Expression")};
    add_inner(std::move(shape), a);
  }

  auto * payload = state.arena.get(construct).as<ConstructPayload>();
  if (payload != nullptr) {
    payload->inner_shapes = std::move(inner);
  }
}

}  // namespace odx
