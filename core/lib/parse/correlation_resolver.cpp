// odx/parse/correlation_resolver.cpp - Correlation usage on Receive shapes
#include "odx/parse/correlation_resolver.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "odx/model/orchestration.hpp"

namespace odx
{

namespace
{

bool append_unique(std::vector<std::string> & names, const std::string & name)
{
  if (std::find(names.begin(), names.end(), name) != names.end()) {
    return false;
  }
  names.push_back(name);
  return true;
}

}  // namespace

size_t resolve_correlations(OrchestrationModel & model)
{
  size_t appended = 0;

  // Every shape is owned by the arena, so a linear scan covers all nesting
  // levels, branch regions and inner payloads included.
  for (uint32_t i = 0; i < model.arena.size(); ++i) {
    const Shape & decl = model.arena.get(ShapeId(i));
    const auto * corr = decl.as<CorrelationPayload>();
    if (corr == nullptr) {
      continue;
    }

    for (const auto & ref : corr->statement_refs) {
      if (ref.statement_oid.empty()) {
        continue;
      }
      auto it = model.oid_index.find(ref.statement_oid);
      if (it == model.oid_index.end()) {
        continue;
      }
      auto * receive = model.arena.get(it->second).as<ReceivePayload>();
      if (receive == nullptr) {
        continue;
      }
      auto & list =
        ref.initializes ? receive->initializes_correlation_sets : receive->follows_correlation_sets;
      if (append_unique(list, decl.name)) {
        ++appended;
      }
    }
  }
  return appended;
}

}  // namespace odx
