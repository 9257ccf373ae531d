// odx/parse/branch_resolver.hpp - Decide / Switch / Listen substructure
//
#pragma once

#include "odx/model/shape.hpp"

namespace tinyxml2
{
class XMLElement;
}

namespace odx
{

class ShapeParser;
struct ParserState;

/**
 * Builds the branch regions of conditional and fan-out shapes.
 *
 * Each branch, case or listen branch is parsed in its own context (sequence
 * counter restarting at zero) and its top-level shapes are re-parented to the
 * owning shape. Region shapes live only in the payload lists; they are never
 * mirrored into the generic child list.
 */
class BranchResolver
{
public:
  explicit BranchResolver(ShapeParser & parser) : parser_(parser) {}

  /**
   * Fill the DecidePayload of `decide`.
   *
   * The first `DecisionBranch` (document order) with a non-blank condition
   * becomes the true branch and supplies the condition; the first other
   * branch becomes the false branch. Without any condition, branches are
   * assigned by position and the condition comes from a sibling Expression
   * element, then from the first Expression shape of the true branch.
   */
  void resolve_decide(const tinyxml2::XMLElement * element, ParserState & state, ShapeId decide);

  /**
   * Fill the SwitchPayload of `switch_id`.
   *
   * A case is the default when its expression is blank or its name contains
   * "default" or "else" (case-insensitive). Other cases are keyed by
   * expression, else name, else `Case_N`; cases sharing a key concatenate.
   */
  void resolve_switch(
    const tinyxml2::XMLElement * element, ParserState & state, ShapeId switch_id);

  /// Fill the ListenPayload of `listen` from its Task / ListenBranch containers
  void resolve_listen(const tinyxml2::XMLElement * element, ParserState & state, ShapeId listen);

private:
  ShapeParser & parser_;
};

}  // namespace odx
