// odx/parse/orchestration_loader.cpp - Source file to OrchestrationModel
#include "odx/parse/orchestration_loader.hpp"

#include <exception>
#include <string>
#include <utility>

#include "odx/basic/error.hpp"
#include "odx/parse/correlation_resolver.hpp"
#include "odx/parse/shape_parser.hpp"
#include "odx/xml/element_reader.hpp"
#include "odx/xml/source_extractor.hpp"
#include "tinyxml2.h"

namespace odx
{

namespace
{

constexpr const char * k_service_path = "Module/ServiceDeclaration";

// Run one section; failures become a SectionError naming the section, and a
// SectionError raised further down is passed through untouched.
template <typename Fn>
void run_section(const std::string & orchestration, const char * section, Fn && fn)
{
  try {
    fn();
  } catch (const SectionError &) {
    throw;
  } catch (const std::exception & e) {
    throw SectionError(orchestration, section, e.what());
  }
}

uint32_t line_of(const tinyxml2::XMLElement * element)
{
  return element ? static_cast<uint32_t>(element->GetLineNum()) : 0;
}

void load_messages(
  const ElementReader & reader, const tinyxml2::XMLElement * root, OrchestrationModel & model)
{
  for (const auto * elem : reader.select(root, std::string(k_service_path) + "/MessageDeclaration")) {
    MessageModel msg;
    msg.name = reader.property(elem, "Name");
    if (msg.name.empty()) {
      continue;
    }
    msg.type = reader.property(elem, "Type");
    msg.direction_text = reader.property(elem, "ParamDirection");
    msg.direction = parse_param_direction(msg.direction_text);
    model.messages.push_back(std::move(msg));
  }
}

// Service-level VariableDeclarations are listed ahead of the body, sequence -1
void load_service_variables(
  const ElementReader & reader, const tinyxml2::XMLElement * root, OrchestrationModel & model,
  DiagnosticBag * diags)
{
  ParserState service(model.arena, model.oid_index, "service", diags);
  for (const auto * elem :
       reader.select(root, std::string(k_service_path) + "/VariableDeclaration")) {
    Shape shape;
    shape.name = reader.property(elem, "Name");
    if (shape.name.empty()) {
      if (diags != nullptr) {
        diags->report_info(line_of(elem), "skipped service variable without a name")
          .with_code("L002");
      }
      continue;
    }
    shape.oid = ElementReader::oid_of(elem);
    shape.kind = ShapeKind::VariableDeclaration;
    shape.shape_type = "VariableDeclaration";
    shape.sequence = -1;
    shape.unique_key = shape.oid + "@service#-1";
    shape.line = line_of(elem);

    VariableDeclarationPayload p;
    p.var_type = reader.property(elem, "Type");
    p.use_default = reader.property(elem, "UseDefaultConstructor");
    shape.payload = std::move(p);

    const std::string oid = shape.oid;
    const ShapeId id = model.arena.create(std::move(shape));
    model.shapes.push_back(id);
    service.register_oid(oid, id);
  }
}

void load_port_types(
  const ElementReader & reader, const tinyxml2::XMLElement * root, OrchestrationModel & model)
{
  for (const auto * elem : reader.select(root, "Module/PortType")) {
    PortTypeModel pt;
    pt.name = reader.property(elem, "Name");
    if (pt.name.empty()) {
      continue;
    }
    pt.modifier = reader.property(elem, "TypeModifier");

    for (const auto * op_elem : reader.select(elem, "OperationDeclaration")) {
      OperationModel op;
      op.name = reader.property(op_elem, "Name");
      if (op.name.empty()) {
        continue;
      }
      op.operation_type = reader.property(op_elem, "OperationType");
      op.kind = parse_operation_kind(op.operation_type);
      op.request_message_type = reader.eval(op_elem, "MessageRef[Name=Request]", "Ref");
      op.response_message_type = reader.eval(op_elem, "MessageRef[Name=Response]", "Ref");
      op.fault_message_type = reader.eval(op_elem, "MessageRef[Name=Fault]", "Ref");
      pt.operations.push_back(std::move(op));
    }
    model.port_types.push_back(std::move(pt));
  }
}

BindingKind detect_binding_kind(const ElementReader & reader, const tinyxml2::XMLElement * port)
{
  if (reader.select_first(port, "LogicalBindingAttribute")) return BindingKind::Logical;
  if (reader.select_first(port, "PhysicalBindingAttribute")) return BindingKind::Physical;
  if (reader.select_first(port, "DirectBindingAttribute")) return BindingKind::Direct;
  if (reader.select_first(port, "WebPortBindingAttribute")) return BindingKind::Web;
  return BindingKind::Unknown;
}

void load_ports(
  const ElementReader & reader, const tinyxml2::XMLElement * root, OrchestrationModel & model)
{
  for (const auto * elem : reader.select(root, std::string(k_service_path) + "/PortDeclaration")) {
    PortModel port;
    port.name = reader.property(elem, "Name");
    if (port.name.empty()) {
      continue;
    }
    port.port_type = reader.property(elem, "Type");
    port.direction = derive_port_direction(
      reader.property(elem, "PortModifier"), reader.property(elem, "Signal"));
    port.binding_kind = detect_binding_kind(reader, elem);

    std::string adapter = reader.eval(elem, "PhysicalBindingAttribute", "TransportType");
    if (adapter.empty()) {
      adapter = reader.eval(elem, "PhysicalBindingAttribute", "Adapter");
    }
    if (adapter.empty()) {
      adapter = reader.eval(elem, "PhysicalBindingAttribute", "AdapterName");
    }
    if (adapter.empty()) {
      adapter = reader.eval(elem, "WebPortBindingAttribute", "TransportType");
    }
    port.adapter_name = adapter;
    port.transport_type = adapter;
    model.ports.push_back(std::move(port));
  }
}

}  // namespace

OrchestrationModel build_orchestration(
  const tinyxml2::XMLDocument & doc, std::string_view source_name, DiagnosticBag * diags)
{
  const ElementReader reader(doc);
  const tinyxml2::XMLElement * root = reader.meta_model(doc);

  OrchestrationModel model;
  if (root != nullptr) {
    model.ns = reader.eval(root, "Module", "Name");
    model.name = reader.eval(root, k_service_path, "Name");
  }
  if (model.name.empty()) {
    throw OdxError(
      ErrorKind::SemanticError, "Failed to extract orchestration name from '" +
                                  std::string(source_name) +
                                  "'. The file structure may be invalid.");
  }

  run_section(model.name, "message declarations", [&] { load_messages(reader, root, model); });

  try {
    load_service_variables(reader, root, model, diags);
  } catch (const std::exception & e) {
    if (diags != nullptr) {
      diags
        ->report_warning(0, std::string("failed to parse service-level variable declarations: ") + e.what())
        .with_code("L001")
        .with_source(std::string(source_name));
    }
  }

  run_section(model.name, "port types", [&] { load_port_types(reader, root, model); });
  run_section(model.name, "port declarations", [&] { load_ports(reader, root, model); });

  const auto * body = reader.select_first(root, std::string(k_service_path) + "/ServiceBody");
  if (body == nullptr) {
    return model;
  }

  run_section(model.name, "shapes", [&] {
    ShapeParser parser(reader);
    ParserState state(model.arena, model.oid_index, "body", diags);
    for (ShapeId id : parser.parse_context(body, state)) {
      model.shapes.push_back(id);
    }
  });

  run_section(model.name, "correlation declarations", [&] { resolve_correlations(model); });

  return model;
}

OrchestrationModel load_orchestration_from_text(
  std::string_view text, std::string_view source_name, DiagnosticBag * diags)
{
  const std::string xml = extract_xml(text, source_name);
  const auto doc = parse_xml_document(xml, source_name);
  return build_orchestration(*doc, source_name, diags);
}

OrchestrationModel load_orchestration(const std::filesystem::path & path, DiagnosticBag * diags)
{
  const std::string text = read_source_file(path);
  return load_orchestration_from_text(text, path.filename().string(), diags);
}

}  // namespace odx
