// odx/parse/branch_resolver.cpp - Decide / Switch / Listen substructure
#include "odx/parse/branch_resolver.hpp"

#include <string>
#include <vector>

#include "odx/basic/string_utils.hpp"
#include "odx/parse/shape_parser.hpp"
#include "tinyxml2.h"

namespace odx
{

namespace
{

// Direct Expression property, else the nested Expression element's
std::string condition_of(const ElementReader & reader, const tinyxml2::XMLElement * branch)
{
  std::string cond = reader.property(branch, "Expression");
  if (is_blank(cond)) {
    cond = reader.eval(branch, "Expression", "Expression");
  }
  return cond;
}

std::string region_suffix(const ParserState & state, ShapeId owner, const std::string & slot)
{
  return "/" + std::to_string(state.arena.get(owner).sequence) + ":" + slot;
}

}  // namespace

// ============================================================================
// Decide
// ============================================================================

void BranchResolver::resolve_decide(
  const tinyxml2::XMLElement * element, ParserState & state, ShapeId decide)
{
  const ElementReader & reader = parser_.reader();
  const auto branches = reader.select(element, "DecisionBranch");

  std::string expression;
  if (branches.empty()) {
    expression = reader.eval(element, "Expression", "Expression");
    if (auto * p = state.arena.get(decide).as<DecidePayload>()) {
      p->expression = std::move(expression);
    }
    return;
  }

  const tinyxml2::XMLElement * true_elem = nullptr;
  const tinyxml2::XMLElement * false_elem = nullptr;
  for (const auto * branch : branches) {
    std::string cond = condition_of(reader, branch);
    if (!is_blank(cond)) {
      true_elem = branch;
      expression = std::move(cond);
      break;
    }
  }

  if (true_elem != nullptr) {
    for (const auto * branch : branches) {
      if (branch != true_elem) {
        false_elem = branch;
        break;
      }
    }
  } else {
    true_elem = branches[0];
    false_elem = branches.size() > 1 ? branches[1] : nullptr;
    expression = reader.eval(element, "Expression", "Expression");
  }

  auto parse_region = [&](const tinyxml2::XMLElement * branch, const char * slot) {
    std::vector<ShapeId> shapes;
    if (branch == nullptr) {
      return shapes;
    }
    ParserState region = state.nested(region_suffix(state, decide, slot));
    shapes = parser_.parse_context(branch, region);
    for (ShapeId id : shapes) {
      state.arena.set_parent(id, decide);
    }
    return shapes;
  };

  std::vector<ShapeId> true_branch = parse_region(true_elem, "true");
  std::vector<ShapeId> false_branch = parse_region(false_elem, "false");

  if (is_blank(expression)) {
    for (ShapeId id : true_branch) {
      if (const auto * expr = state.arena.get(id).as<ExpressionPayload>();
          expr != nullptr && state.arena.get(id).is(ShapeKind::Expression)) {
        expression = expr->expression;
        break;
      }
    }
  }

  auto * payload = state.arena.get(decide).as<DecidePayload>();
  if (payload != nullptr) {
    payload->expression = std::move(expression);
    payload->true_branch = std::move(true_branch);
    payload->false_branch = std::move(false_branch);
  }
}

// ============================================================================
// Switch
// ============================================================================

void BranchResolver::resolve_switch(
  const tinyxml2::XMLElement * element, ParserState & state, ShapeId switch_id)
{
  const ElementReader & reader = parser_.reader();

  SwitchPayload result;
  result.expression = reader.property(element, "Expression");
  if (result.expression.empty()) {
    result.expression = reader.eval(element, "Expression", "Expression");
  }

  const auto cases = reader.select(element, "DecisionBranch");
  for (size_t i = 0; i < cases.size(); ++i) {
    const auto * case_elem = cases[i];
    const std::string index = std::to_string(i + 1);
    // Case values come from the branch itself; an Expression shape in the body is not a key
    const std::string value = reader.property(case_elem, "Expression");
    const std::string name = reader.property(case_elem, "Name");

    ParserState region = state.nested(region_suffix(state, switch_id, "case" + index));
    std::vector<ShapeId> shapes = parser_.parse_context(case_elem, region);
    for (ShapeId id : shapes) {
      state.arena.set_parent(id, switch_id);
    }

    const bool is_default =
      is_blank(value) || icontains(name, "default") || icontains(name, "else");
    if (is_default) {
      result.default_case.insert(result.default_case.end(), shapes.begin(), shapes.end());
      continue;
    }

    std::string key;
    if (!is_blank(value)) {
      key = value;
    } else if (!name.empty()) {
      key = name;
    } else {
      key = "Case_" + index;
    }
    auto & target = result.case_for(key).shapes;
    target.insert(target.end(), shapes.begin(), shapes.end());
  }

  if (auto * payload = state.arena.get(switch_id).as<SwitchPayload>()) {
    *payload = std::move(result);
  }
}

// ============================================================================
// Listen
// ============================================================================

void BranchResolver::resolve_listen(
  const tinyxml2::XMLElement * element, ParserState & state, ShapeId listen)
{
  const ElementReader & reader = parser_.reader();

  std::vector<ShapeId> branches;
  const auto containers = reader.select(element, "Task|ListenBranch");
  for (size_t i = 0; i < containers.size(); ++i) {
    ParserState region =
      state.nested(region_suffix(state, listen, "listen" + std::to_string(i + 1)));
    for (ShapeId id : parser_.parse_context(containers[i], region)) {
      state.arena.set_parent(id, listen);
      branches.push_back(id);
    }
  }

  if (auto * payload = state.arena.get(listen).as<ListenPayload>()) {
    payload->branches = std::move(branches);
  }
}

}  // namespace odx
