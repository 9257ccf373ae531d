// odx/analysis/receive_pattern.hpp - Trigger classification of activating receives
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "odx/model/orchestration.hpp"

namespace odx
{

enum class ReceivePattern : uint8_t {
  Callable,                 // no activating receive
  SingleTrigger,            // exactly one activating receive
  Convoy,                   // one activating receive initializing a set others follow
  ListenFirstToComplete,    // several activating receives under one Listen
  ParallelAllMustComplete,  // several activating receives under Parallel shapes
  Invalid,                  // several sequential activating receives
};

[[nodiscard]] std::string_view to_string(ReceivePattern pattern);

struct ReceivePatternAnalysis
{
  ReceivePattern pattern = ReceivePattern::Callable;
  std::optional<ShapeId> primary_receive;
  std::vector<ShapeId> secondary_receives;

  bool requires_session_support = false;
  bool requires_request_trigger = false;
  bool requires_timeout_handling = false;

  std::string migration_error;
  std::vector<std::string> migration_warnings;

  /// False for Invalid and ParallelAllMustComplete
  [[nodiscard]] bool is_valid() const noexcept
  {
    return pattern != ReceivePattern::Invalid && pattern != ReceivePattern::ParallelAllMustComplete;
  }

  [[nodiscard]] size_t total_receive_count() const noexcept
  {
    return (primary_receive ? 1 : 0) + secondary_receives.size();
  }
};

/**
 * Classify how a model is triggered.
 *
 * Receives are collected over the full traversal (branch, case, listen and
 * inner regions included); ancestors are found through parent handles.
 */
[[nodiscard]] ReceivePatternAnalysis analyze_receive_pattern(const OrchestrationModel & model);

}  // namespace odx
