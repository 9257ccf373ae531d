// odx/model/shape.cpp
#include "odx/model/shape.hpp"

namespace odx
{

std::string_view to_string(ShapeKind kind)
{
  switch (kind) {
#define SHAPE_KIND(Kind, Snake) \
  case ShapeKind::Kind:         \
    return #Snake;
#include "odx/model/shape_kinds.def"
  }
  return "unknown";
}

const SwitchCase * SwitchPayload::find_case(std::string_view key) const
{
  for (const auto & c : cases) {
    if (c.key == key) {
      return &c;
    }
  }
  return nullptr;
}

SwitchCase & SwitchPayload::case_for(const std::string & key)
{
  for (auto & c : cases) {
    if (c.key == key) {
      return c;
    }
  }
  cases.push_back(SwitchCase{key, {}});
  return cases.back();
}

}  // namespace odx
