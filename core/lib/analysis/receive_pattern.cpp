// odx/analysis/receive_pattern.cpp - Trigger classification of activating receives
#include "odx/analysis/receive_pattern.hpp"

#include <algorithm>
#include <fmt/format.h>

#include "odx/analysis/shape_walker.hpp"

namespace odx
{

std::string_view to_string(ReceivePattern pattern)
{
  switch (pattern) {
    case ReceivePattern::Callable:
      return "Callable";
    case ReceivePattern::SingleTrigger:
      return "SingleTrigger";
    case ReceivePattern::Convoy:
      return "Convoy";
    case ReceivePattern::ListenFirstToComplete:
      return "ListenFirstToComplete";
    case ReceivePattern::ParallelAllMustComplete:
      return "ParallelAllMustComplete";
    case ReceivePattern::Invalid:
      return "Invalid";
  }
  return "Invalid";
}

ReceivePatternAnalysis analyze_receive_pattern(const OrchestrationModel & model)
{
  std::vector<ShapeId> receives;
  std::vector<ShapeId> activating;
  ShapeWalker(model).walk([&](ShapeId id, const Shape & shape, size_t) {
    if (const auto * r = shape.as<ReceivePayload>()) {
      receives.push_back(id);
      if (r->activate) {
        activating.push_back(id);
      }
    }
  });

  ReceivePatternAnalysis result;

  if (activating.empty()) {
    result.pattern = ReceivePattern::Callable;
    result.requires_request_trigger = true;
    result.migration_warnings.emplace_back(
      "No activating Receive shapes found. Workflow will use HTTP Request trigger (callable "
      "workflow).");
    return result;
  }

  if (activating.size() == 1) {
    const ShapeId primary = activating.front();
    result.primary_receive = primary;
    result.pattern = ReceivePattern::SingleTrigger;

    const auto * payload = model.shape(primary).as<ReceivePayload>();
    if (!payload->initializes_correlation_sets.empty()) {
      std::vector<ShapeId> followers;
      for (ShapeId id : receives) {
        const auto * r = model.shape(id).as<ReceivePayload>();
        if (!r->activate && !r->follows_correlation_sets.empty()) {
          followers.push_back(id);
        }
      }
      if (!followers.empty()) {
        result.pattern = ReceivePattern::Convoy;
        result.requires_session_support = true;
        result.migration_warnings.push_back(fmt::format(
          "Convoy pattern detected with {} correlated receive(s). Requires Service Bus with "
          "session support or custom correlation implementation.",
          followers.size()));
        result.secondary_receives = std::move(followers);
      }
    }
    return result;
  }

  result.primary_receive = activating.front();
  result.secondary_receives.assign(activating.begin() + 1, activating.end());

  // Several activating receives: a common Listen ancestor first
  std::vector<ShapeId> listens;
  for (ShapeId id : activating) {
    if (auto listen = find_ancestor(model, id, ShapeKind::Listen)) {
      listens.push_back(*listen);
    }
  }
  const bool same_listen =
    listens.size() == activating.size() &&
    std::all_of(listens.begin(), listens.end(), [&](ShapeId l) { return l == listens.front(); });
  if (same_listen) {
    result.pattern = ReceivePattern::ListenFirstToComplete;
    result.requires_timeout_handling = true;
    result.migration_warnings.push_back(fmt::format(
      "Listen shape with {} activating receives detected. Will map first receive to trigger and "
      "others to Switch/timeout actions. Note: Logic Apps does not natively support "
      "'first-to-complete cancels others' semantics.",
      activating.size()));
    return result;
  }

  const bool all_parallel = std::all_of(activating.begin(), activating.end(), [&](ShapeId id) {
    return find_ancestor(model, id, ShapeKind::Parallel).has_value();
  });
  if (all_parallel) {
    result.pattern = ReceivePattern::ParallelAllMustComplete;
    result.migration_error = fmt::format(
      "INVALID PATTERN: {} activating Receive shapes in Parallel branches detected. Azure Logic "
      "Apps workflows can only have ONE trigger. Recommendation: Split into multiple workflows or "
      "use correlation-based sequential receives.",
      activating.size());
    return result;
  }

  result.pattern = ReceivePattern::Invalid;
  result.migration_error = fmt::format(
    "INVALID PATTERN: {} sequential activating Receive shapes detected. Azure Logic Apps "
    "workflows can only have ONE trigger. Recommendation: Redesign to use correlation (convoy "
    "pattern) or split into multiple workflows.",
    activating.size());
  return result;
}

}  // namespace odx
