// odx/analysis/shape_walker.hpp - Full traversal of a shape tree
//
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

#include "odx/model/orchestration.hpp"

namespace odx
{

/**
 * Pre-order traversal over every shape reachable from the top-level list.
 *
 * For each shape the walker visits, in order: the shape itself, its generic
 * children, then its region lists (Decide true/false branches, Switch cases
 * in first-seen order followed by the default case, Listen branches, Construct
 * inner shapes). The walker never mutates the model.
 */
class ShapeWalker
{
public:
  using Visitor = std::function<void(ShapeId id, const Shape & shape, size_t depth)>;

  explicit ShapeWalker(const OrchestrationModel & model) : model_(model) {}

  /// Visit every shape of the model
  void walk(const Visitor & visitor) const;

  /// Visit `root` and everything below it
  void walk_from(ShapeId root, const Visitor & visitor, size_t depth = 0) const;

  /// Every shape in traversal order
  [[nodiscard]] std::vector<ShapeId> collect() const;

  /// Region lists of a shape, in traversal order (generic children excluded)
  [[nodiscard]] static std::vector<ShapeId> regions_of(const Shape & shape);

private:
  const OrchestrationModel & model_;
};

/// Nearest ancestor of `id` with the given kind, following parent handles
[[nodiscard]] std::optional<ShapeId> find_ancestor(
  const OrchestrationModel & model, ShapeId id, ShapeKind kind);

}  // namespace odx
