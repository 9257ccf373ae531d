// odx/model/model_json.hpp - JSON serialization for orchestration models
//
// Produces nlohmann::json objects for a whole model or a single shape
// subtree. Branch, case, listen and inner payload handles are expanded in
// place, so the output is a self-contained tree.
//
#pragma once

#include <nlohmann/json.hpp>

#include "odx/model/orchestration.hpp"

namespace odx
{

/**
 * Serialize a model: header, messages, port types, ports and the shape tree.
 *
 * @param model The model to serialize
 * @return JSON object with keys "namespace", "name", "fullName", "messages",
 *         "portTypes", "ports" and "shapes"
 */
[[nodiscard]] nlohmann::json to_json(const OrchestrationModel & model);

/// Serialize one shape and everything below it
[[nodiscard]] nlohmann::json to_json(const OrchestrationModel & model, ShapeId id);

}  // namespace odx
