// odx/model/shape.hpp - Control-flow shape nodes
//
// A Shape is a shared header (identifier, name, kind, sequence, parent,
// generic children) plus a per-kind payload held in a std::variant.
// Shapes never own each other; they refer to one another through ShapeId
// handles into the ShapeArena of their orchestration.
//
#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace odx
{

// ============================================================================
// Shape Kind
// ============================================================================

enum class ShapeKind : uint8_t {
#define SHAPE_KIND(Kind, Snake) Kind,
#include "odx/model/shape_kinds.def"
};

[[nodiscard]] std::string_view to_string(ShapeKind kind);

// ============================================================================
// ShapeId
// ============================================================================

/**
 * Stable handle of a shape inside its ShapeArena.
 */
struct ShapeId
{
  static constexpr uint32_t k_invalid = std::numeric_limits<uint32_t>::max();

  uint32_t value = k_invalid;

  constexpr ShapeId() = default;
  constexpr explicit ShapeId(uint32_t v) : value(v) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid; }

  friend constexpr bool operator==(ShapeId a, ShapeId b) { return a.value == b.value; }
  friend constexpr bool operator!=(ShapeId a, ShapeId b) { return a.value != b.value; }
  friend constexpr bool operator<(ShapeId a, ShapeId b) { return a.value < b.value; }
};

// ============================================================================
// Payloads
// ============================================================================

struct ReceivePayload
{
  std::string port_name;
  std::string message_name;
  std::string operation_name;
  std::string operation_message_name;
  bool activate = false;

  // Filled by the correlation pass
  std::vector<std::string> initializes_correlation_sets;
  std::vector<std::string> follows_correlation_sets;
};

struct SendPayload
{
  std::string port_name;
  std::string message_name;
  std::string operation_name;
  std::string operation_message_name;
};

struct ConstructPayload
{
  std::vector<std::string> constructed_messages;
  /// Inline Transform / MessageAssignment shapes (not generic children)
  std::vector<ShapeId> inner_shapes;
};

struct TransformPayload
{
  std::string class_name;
  std::vector<std::string> input_messages;
  std::vector<std::string> output_messages;
};

/// MessageAssignment, VariableAssignment, Expression, While, Until
struct ExpressionPayload
{
  std::string expression;
};

struct LoopPayload
{
  std::string loop_type;  // "Loop" or "ForEach"
  std::string collection_expression;
  std::string item_variable = "item";
};

/// Call and Start
struct InvokePayload
{
  std::string invokee;
};

struct StatementRef
{
  std::string statement_oid;
  bool initializes = false;
};

struct CorrelationPayload
{
  std::string correlation_type;
  std::vector<StatementRef> statement_refs;
};

struct DecidePayload
{
  std::string expression;
  std::vector<ShapeId> true_branch;
  std::vector<ShapeId> false_branch;
};

struct SwitchCase
{
  std::string key;
  std::vector<ShapeId> shapes;
};

struct SwitchPayload
{
  std::string expression;
  /// Keyed cases in first-seen order; keys are unique
  std::vector<SwitchCase> cases;
  std::vector<ShapeId> default_case;

  [[nodiscard]] const SwitchCase * find_case(std::string_view key) const;
  SwitchCase & case_for(const std::string & key);
};

struct ListenPayload
{
  std::vector<ShapeId> branches;
};

/// Throw, Suspend, Terminate
struct TerminatePayload
{
  std::string error_message;
};

struct DelayPayload
{
  std::string delay_expression;
};

struct CompensatePayload
{
  std::string target;
};

struct CatchPayload
{
  std::string exception_type = "System.Exception";
  std::string exception_variable = "ex";
};

struct VariableDeclarationPayload
{
  std::string var_type;
  std::string use_default;
};

struct CallRulesPayload
{
  std::string policy_name;
};

struct FallbackPayload
{
  std::string kind_name;
  std::string details;
};

using ShapePayload = std::variant<
  std::monostate, ReceivePayload, SendPayload, ConstructPayload, TransformPayload,
  ExpressionPayload, LoopPayload, InvokePayload, CorrelationPayload, DecidePayload, SwitchPayload,
  ListenPayload, TerminatePayload, DelayPayload, CompensatePayload, CatchPayload,
  VariableDeclarationPayload, CallRulesPayload, FallbackPayload>;

// ============================================================================
// Shape
// ============================================================================

struct Shape
{
  std::string oid;
  std::string name;
  ShapeKind kind = ShapeKind::Fallback;
  /// Shape type as reported to the analyzer ("Decide", "StartOrchestration", ...)
  std::string shape_type;
  int sequence = 0;
  std::optional<ShapeId> parent;
  std::vector<ShapeId> children;
  /// Deterministic key: <oid>@<context path>#<sequence>
  std::string unique_key;
  /// Line of the source element in the embedded XML, 0 when unknown
  uint32_t line = 0;
  ShapePayload payload;

  template <typename T>
  [[nodiscard]] T * as()
  {
    return std::get_if<T>(&payload);
  }

  template <typename T>
  [[nodiscard]] const T * as() const
  {
    return std::get_if<T>(&payload);
  }

  [[nodiscard]] bool is(ShapeKind k) const noexcept { return kind == k; }
};

}  // namespace odx
