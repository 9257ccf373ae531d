// odx/model/shape_arena.hpp - Owner of all shapes of one orchestration
//
#pragma once

#include <deque>
#include <gsl/span>
#include <stdexcept>
#include <utility>

#include "odx/model/shape.hpp"

namespace odx
{

/**
 * Arena that owns every shape of one orchestration.
 *
 * Shapes are addressed by ShapeId handles. Storage is a deque, so references
 * returned by get() stay valid while more shapes are created.
 *
 * Example:
 * @code
 *   ShapeArena arena;
 *   ShapeId scope = arena.create(Shape{...});
 *   ShapeId send = arena.create(Shape{...});
 *   arena.attach_child(scope, send);
 * @endcode
 */
class ShapeArena
{
public:
  ShapeArena() = default;

  ShapeArena(const ShapeArena &) = delete;
  ShapeArena & operator=(const ShapeArena &) = delete;
  ShapeArena(ShapeArena &&) = default;
  ShapeArena & operator=(ShapeArena &&) = default;

  ShapeId create(Shape shape)
  {
    const ShapeId id(static_cast<uint32_t>(shapes_.size()));
    shapes_.push_back(std::move(shape));
    return id;
  }

  [[nodiscard]] Shape & get(ShapeId id)
  {
    check(id);
    return shapes_[id.value];
  }

  [[nodiscard]] const Shape & get(ShapeId id) const
  {
    check(id);
    return shapes_[id.value];
  }

  [[nodiscard]] Shape & operator[](ShapeId id) { return get(id); }
  [[nodiscard]] const Shape & operator[](ShapeId id) const { return get(id); }

  [[nodiscard]] size_t size() const noexcept { return shapes_.size(); }
  [[nodiscard]] bool empty() const noexcept { return shapes_.empty(); }

  /// Link `child` under `parent` and list it among the generic children
  void attach_child(ShapeId parent, ShapeId child)
  {
    get(child).parent = parent;
    get(parent).children.push_back(child);
  }

  /// Set the parent of a shape held in a payload list (branch, case, inner shape)
  void set_parent(ShapeId child, ShapeId parent) { get(child).parent = parent; }

  [[nodiscard]] gsl::span<const ShapeId> children_of(ShapeId id) const
  {
    const auto & c = get(id).children;
    return gsl::span<const ShapeId>(c.data(), c.size());
  }

private:
  void check(ShapeId id) const
  {
    if (!id.is_valid() || id.value >= shapes_.size()) {
      throw std::out_of_range("invalid ShapeId");
    }
  }

  std::deque<Shape> shapes_;
};

}  // namespace odx
