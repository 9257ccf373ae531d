// odx/xml/element_reader.cpp
#include "odx/xml/element_reader.hpp"

#include <optional>
#include <stdexcept>
#include <utility>

#include "tinyxml2.h"

namespace odx
{

namespace
{

std::string get_string_attr(const tinyxml2::XMLElement * elem, const char * name)
{
  const char * val = elem->Attribute(name);
  return val ? std::string(val) : std::string();
}

std::string qualify(const std::string & prefix, const char * local)
{
  return prefix.empty() ? std::string(local) : prefix + ":" + local;
}

// Prefix bound to the DesignerData namespace on the root element
std::optional<std::string> find_designer_prefix(const tinyxml2::XMLElement * root)
{
  if (root == nullptr) {
    return std::nullopt;
  }
  for (const auto * attr = root->FirstAttribute(); attr; attr = attr->Next()) {
    const std::string_view name = attr->Name();
    if (attr->Value() == nullptr || k_designer_data_namespace != attr->Value()) {
      continue;
    }
    if (name == "xmlns") {
      return std::string();
    }
    if (name.substr(0, 6) == "xmlns:") {
      return std::string(name.substr(6));
    }
  }
  return std::nullopt;
}

std::string_view trim(std::string_view s)
{
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

PathStep parse_step(std::string_view text)
{
  PathStep step;

  std::string_view types = text;
  const size_t bracket = text.find('[');
  if (bracket != std::string_view::npos) {
    if (text.back() != ']') {
      throw std::invalid_argument("unterminated predicate in path step '" + std::string(text) + "'");
    }
    types = text.substr(0, bracket);
    const std::string_view pred = text.substr(bracket + 1, text.size() - bracket - 2);
    const size_t eq = pred.find('=');
    if (eq == std::string_view::npos) {
      throw std::invalid_argument("predicate must be [Name=Value]: '" + std::string(text) + "'");
    }
    step.property_name = std::string(trim(pred.substr(0, eq)));
    step.property_value = std::string(trim(pred.substr(eq + 1)));
  }

  types = trim(types);
  if (types.empty()) {
    throw std::invalid_argument("empty type in path step '" + std::string(text) + "'");
  }
  if (types == "*") {
    return step;
  }

  size_t pos = 0;
  while (pos <= types.size()) {
    const size_t bar = types.find('|', pos);
    const std::string_view alt =
      trim(types.substr(pos, bar == std::string_view::npos ? std::string_view::npos : bar - pos));
    if (!alt.empty()) {
      step.types.emplace_back(alt);
    }
    if (bar == std::string_view::npos) break;
    pos = bar + 1;
  }
  return step;
}

}  // namespace

std::vector<PathStep> parse_element_path(std::string_view path)
{
  std::vector<PathStep> steps;
  size_t pos = 0;
  while (pos < path.size()) {
    // '/' inside a predicate value belongs to the value
    size_t end = pos;
    bool in_pred = false;
    for (; end < path.size(); ++end) {
      if (path[end] == '[') in_pred = true;
      if (path[end] == ']') in_pred = false;
      if (path[end] == '/' && !in_pred) break;
    }
    const std::string_view seg = trim(path.substr(pos, end - pos));
    if (!seg.empty()) {
      steps.push_back(parse_step(seg));
    }
    pos = end + 1;
  }
  return steps;
}

// ============================================================================
// ElementReader
// ============================================================================

ElementReader::ElementReader(const tinyxml2::XMLDocument & doc)
: ElementReader(find_designer_prefix(doc.RootElement()).value_or("om"))
{
}

ElementReader::ElementReader(std::string prefix)
: prefix_(std::move(prefix)),
  element_tag_(qualify(prefix_, "Element")),
  property_tag_(qualify(prefix_, "Property")),
  meta_model_tag_(qualify(prefix_, "MetaModel"))
{
}

const tinyxml2::XMLElement * ElementReader::meta_model(const tinyxml2::XMLDocument & doc) const
{
  const auto * root = doc.RootElement();
  if (root == nullptr || meta_model_tag_ != root->Name()) {
    return nullptr;
  }
  return root;
}

bool ElementReader::is_element(const tinyxml2::XMLElement * node) const
{
  return node != nullptr && element_tag_ == node->Name();
}

std::vector<const tinyxml2::XMLElement *> ElementReader::child_elements(
  const tinyxml2::XMLElement * parent) const
{
  std::vector<const tinyxml2::XMLElement *> out;
  if (parent == nullptr) {
    return out;
  }
  for (const auto * child = parent->FirstChildElement(element_tag_.c_str()); child;
       child = child->NextSiblingElement(element_tag_.c_str())) {
    out.push_back(child);
  }
  return out;
}

bool ElementReader::matches(const tinyxml2::XMLElement * element, const PathStep & step) const
{
  if (!step.types.empty()) {
    const char * type = element->Attribute("Type");
    if (type == nullptr) {
      return false;
    }
    bool found = false;
    for (const auto & t : step.types) {
      if (t == type) {
        found = true;
        break;
      }
    }
    if (!found) {
      return false;
    }
  }
  if (step.property_name) {
    return property(element, *step.property_name) == step.property_value;
  }
  return true;
}

std::vector<const tinyxml2::XMLElement *> ElementReader::select(
  const tinyxml2::XMLElement * from, std::string_view path) const
{
  std::vector<const tinyxml2::XMLElement *> current;
  if (from == nullptr) {
    return current;
  }
  current.push_back(from);

  for (const auto & step : parse_element_path(path)) {
    std::vector<const tinyxml2::XMLElement *> next;
    for (const auto * node : current) {
      for (const auto * child : child_elements(node)) {
        if (matches(child, step)) {
          next.push_back(child);
        }
      }
    }
    current = std::move(next);
    if (current.empty()) {
      break;
    }
  }
  return current;
}

const tinyxml2::XMLElement * ElementReader::select_first(
  const tinyxml2::XMLElement * from, std::string_view path) const
{
  auto all = select(from, path);
  return all.empty() ? nullptr : all.front();
}

const char * ElementReader::find_property_value(
  const tinyxml2::XMLElement * element, std::string_view name) const
{
  if (element == nullptr) {
    return nullptr;
  }
  for (const auto * prop = element->FirstChildElement(property_tag_.c_str()); prop;
       prop = prop->NextSiblingElement(property_tag_.c_str())) {
    const char * prop_name = prop->Attribute("Name");
    if (prop_name != nullptr && name == prop_name) {
      if (const char * value = prop->Attribute("Value")) {
        return value;
      }
    }
  }
  return nullptr;
}

std::string ElementReader::property(
  const tinyxml2::XMLElement * element, std::string_view name) const
{
  const char * value = find_property_value(element, name);
  return value ? std::string(value) : std::string();
}

std::string ElementReader::eval(
  const tinyxml2::XMLElement * from, std::string_view path, std::string_view property_name) const
{
  // First matched element that actually carries the property wins
  for (const auto * element : select(from, path)) {
    if (const char * value = find_property_value(element, property_name)) {
      return value;
    }
  }
  return {};
}

std::string ElementReader::type_of(const tinyxml2::XMLElement * element)
{
  return element ? get_string_attr(element, "Type") : std::string();
}

std::string ElementReader::oid_of(const tinyxml2::XMLElement * element)
{
  return element ? get_string_attr(element, "OID") : std::string();
}

}  // namespace odx
