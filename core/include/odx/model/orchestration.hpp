// odx/model/orchestration.hpp - Orchestration aggregate (messages, ports, shapes)
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "odx/model/shape.hpp"
#include "odx/model/shape_arena.hpp"

namespace odx
{

// ============================================================================
// Messages
// ============================================================================

enum class ParamDirection : uint8_t {
  None,
  In,
  Out,
  InOut,
};

[[nodiscard]] ParamDirection parse_param_direction(std::string_view text);
[[nodiscard]] std::string_view to_string(ParamDirection dir);

struct MessageModel
{
  std::string name;
  std::string type;            // schema type
  std::string direction_text;  // raw ParamDirection value
  ParamDirection direction = ParamDirection::None;
};

// ============================================================================
// Port types
// ============================================================================

enum class OperationKind : uint8_t {
  OneWay,
  RequestResponse,
  Unknown,
};

[[nodiscard]] OperationKind parse_operation_kind(std::string_view text);
[[nodiscard]] std::string_view to_string(OperationKind kind);

struct OperationModel
{
  std::string name;
  std::string operation_type;  // raw OperationType value
  OperationKind kind = OperationKind::Unknown;

  // Message-type names; resolved lazily through find_message_type()
  std::string request_message_type;
  std::string response_message_type;
  std::string fault_message_type;
};

struct PortTypeModel
{
  std::string name;
  std::string modifier;
  std::vector<OperationModel> operations;

  [[nodiscard]] const OperationModel * find_operation(std::string_view op_name) const;
};

// ============================================================================
// Ports
// ============================================================================

enum class PortDirection : uint8_t {
  None,
  Receive,
  Send,
  ReceiveSend,
  SendReceive,
};

enum class BindingKind : uint8_t {
  Logical,
  Physical,
  Direct,
  Web,
  Unknown,
};

/**
 * Derive a port direction from the raw PortModifier and Signal properties.
 *
 *   Implements + Signal=True -> Receive
 *   Implements               -> ReceiveSend
 *   Uses + Signal=True       -> SendReceive
 *   Uses                     -> Send
 *   anything else            -> None
 */
[[nodiscard]] PortDirection derive_port_direction(
  std::string_view port_modifier, std::string_view signal);

[[nodiscard]] std::string_view to_string(PortDirection dir);
[[nodiscard]] std::string_view to_string(BindingKind kind);

struct PortModel
{
  std::string name;
  std::string port_type;
  PortDirection direction = PortDirection::None;
  BindingKind binding_kind = BindingKind::Unknown;
  std::string adapter_name;
  std::string transport_type;

  // Runtime binding data, filled in by the binding merge step
  std::string address;
  std::string folder_path;
  std::string file_mask;
  std::optional<int> polling_interval_seconds;
  std::string receive_pipeline_name;
  std::string send_pipeline_name;
};

// ============================================================================
// OrchestrationModel
// ============================================================================

/**
 * Root aggregate produced by the loader.
 *
 * Owns every shape (through the arena). `shapes` lists the top-level shapes
 * in document order; `oid_index` maps identifiers to the first shape that
 * declared them, across the whole tree.
 */
struct OrchestrationModel
{
  std::string ns;
  std::string name;

  std::vector<MessageModel> messages;
  std::vector<PortTypeModel> port_types;
  std::vector<PortModel> ports;

  std::vector<ShapeId> shapes;
  ShapeArena arena;
  std::unordered_map<std::string, ShapeId> oid_index;

  /// "<namespace>.<name>", or just the name when the namespace is empty
  [[nodiscard]] std::string full_name() const;

  /// Schema type of a logical message, or the logical name itself when undeclared
  [[nodiscard]] std::string find_message_type(std::string_view logical_name) const;

  [[nodiscard]] const PortModel * find_port(std::string_view port_name) const;
  [[nodiscard]] const PortTypeModel * find_port_type(std::string_view type_name) const;

  [[nodiscard]] const Shape * find_by_oid(const std::string & oid) const;

  [[nodiscard]] Shape & shape(ShapeId id) { return arena.get(id); }
  [[nodiscard]] const Shape & shape(ShapeId id) const { return arena.get(id); }
};

}  // namespace odx
