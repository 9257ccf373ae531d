// odx/analysis/shape_walker.cpp - Full traversal of a shape tree
#include "odx/analysis/shape_walker.hpp"

namespace odx
{

void ShapeWalker::walk(const Visitor & visitor) const
{
  for (ShapeId id : model_.shapes) {
    walk_from(id, visitor, 0);
  }
}

void ShapeWalker::walk_from(ShapeId root, const Visitor & visitor, size_t depth) const
{
  const Shape & shape = model_.shape(root);
  visitor(root, shape, depth);

  for (ShapeId child : model_.arena.children_of(root)) {
    walk_from(child, visitor, depth + 1);
  }
  for (ShapeId region : regions_of(shape)) {
    walk_from(region, visitor, depth + 1);
  }
}

std::vector<ShapeId> ShapeWalker::collect() const
{
  std::vector<ShapeId> out;
  walk([&](ShapeId id, const Shape &, size_t) { out.push_back(id); });
  return out;
}

std::vector<ShapeId> ShapeWalker::regions_of(const Shape & shape)
{
  std::vector<ShapeId> out;
  auto append = [&](const std::vector<ShapeId> & ids) {
    out.insert(out.end(), ids.begin(), ids.end());
  };

  if (const auto * d = shape.as<DecidePayload>()) {
    append(d->true_branch);
    append(d->false_branch);
  } else if (const auto * s = shape.as<SwitchPayload>()) {
    for (const auto & c : s->cases) {
      append(c.shapes);
    }
    append(s->default_case);
  } else if (const auto * l = shape.as<ListenPayload>()) {
    append(l->branches);
  } else if (const auto * c = shape.as<ConstructPayload>()) {
    append(c->inner_shapes);
  }
  return out;
}

std::optional<ShapeId> find_ancestor(const OrchestrationModel & model, ShapeId id, ShapeKind kind)
{
  std::optional<ShapeId> current = model.shape(id).parent;
  while (current) {
    const Shape & s = model.shape(*current);
    if (s.is(kind)) {
      return current;
    }
    current = s.parent;
  }
  return std::nullopt;
}

}  // namespace odx
