// odx/parse/shape_parser.hpp - Recursive-descent builder of the shape tree
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "odx/basic/diagnostic.hpp"
#include "odx/model/shape.hpp"
#include "odx/model/shape_arena.hpp"
#include "odx/xml/element_reader.hpp"

namespace tinyxml2
{
class XMLElement;
}

namespace odx
{

// ============================================================================
// ParserState
// ============================================================================

/**
 * State threaded through the recursive build.
 *
 * One state corresponds to one parsing context: the service body, a Decide
 * branch, a Switch case or a Listen branch. Each context owns its sequence
 * counter; the identifier index, the arena and the diagnostic sink are shared
 * by every context of the same file.
 */
struct ParserState
{
  ParserState(
    ShapeArena & arena, std::unordered_map<std::string, ShapeId> & oid_index,
    std::string context_path = "body", DiagnosticBag * diags = nullptr)
  : arena(arena), oid_index(oid_index), context_path(std::move(context_path)), diags(diags)
  {
  }

  ShapeArena & arena;
  std::unordered_map<std::string, ShapeId> & oid_index;
  std::string context_path;
  DiagnosticBag * diags;
  int sequence = 0;

  int next_sequence() { return sequence++; }

  /// Fresh context (counter at zero) below this one
  [[nodiscard]] ParserState nested(std::string_view suffix) const;

  /**
   * Register `id` under `oid` unless the identifier is empty or taken.
   *
   * A taken identifier keeps its first shape and is reported as P002.
   */
  void register_oid(const std::string & oid, ShapeId id);

  [[nodiscard]] std::string make_key(std::string_view oid, int seq) const;
};

// ============================================================================
// ShapeParser
// ============================================================================

/**
 * Converts designer `Element`s into shapes.
 *
 * Every child `Element` of a container is dispatched on its `Type` attribute
 * to a per-kind builder; the resulting shape takes the next sequence value of
 * the current context, is linked to its parent and registered in the
 * identifier index. Generic recursion into raw children is skipped for
 * Decide, Switch and Listen (their regions are parsed by the BranchResolver)
 * and for Construct and MessageAssignment (payload parsed inline).
 */
class ShapeParser
{
public:
  explicit ShapeParser(const ElementReader & reader) : reader_(reader) {}

  /**
   * Parse the children of `container` as a context of their own.
   *
   * @return The top-level shapes of the context, in document order
   */
  std::vector<ShapeId> parse_context(const tinyxml2::XMLElement * container, ParserState & state);

  /// Parse the children of `container` as generic children of `parent`
  void parse_children(
    const tinyxml2::XMLElement * container, ParserState & state, ShapeId parent);

  [[nodiscard]] const ElementReader & reader() const noexcept { return reader_; }

  /**
   * Build a Transform shape (also used for inline Construct payloads).
   *
   * With exactly two message references, the second is the output and the
   * first the only input.
   */
  [[nodiscard]] Shape build_transform(const tinyxml2::XMLElement * element) const;

private:
  void parse_elements(
    const tinyxml2::XMLElement * container, ParserState & state, std::optional<ShapeId> parent,
    std::vector<ShapeId> * roots);

  std::optional<ShapeId> parse_shape(
    const tinyxml2::XMLElement * element, ParserState & state, std::optional<ShapeId> parent);

  [[nodiscard]] Shape build_shape(
    const tinyxml2::XMLElement * element, const std::string & type, ShapeKind kind,
    std::string_view reported_type) const;

  [[nodiscard]] Shape build_call_rules(const tinyxml2::XMLElement * element) const;

  void parse_construct_payload(
    const tinyxml2::XMLElement * element, ParserState & state, ShapeId construct);

  const ElementReader & reader_;
};

/// "Execute_Rules_Engine_<segment>" or "Execute_Rules_Engine" for an empty policy
[[nodiscard]] std::string call_rules_name(std::string_view policy);

/// Policy stripped of non-alphanumerics, capped at 40 characters
[[nodiscard]] std::string safe_policy_segment(std::string_view policy);

}  // namespace odx
