// odx/parse/orchestration_loader.hpp - Source file to OrchestrationModel
//
#pragma once

#include <filesystem>
#include <string_view>

#include "odx/basic/diagnostic.hpp"
#include "odx/model/orchestration.hpp"

namespace tinyxml2
{
class XMLDocument;
}

namespace odx
{

/**
 * Load one orchestration file.
 *
 * Reads the file, isolates the embedded XML, and builds the model in this
 * order: header (namespace, name), messages, service-level variables, port
 * types, ports, shape tree, correlation pass.
 *
 * @param path  Path of the `.odx` file
 * @param diags Optional sink for warnings (unknown shapes, skipped sections)
 * @throws OdxError IoError, FormatError, SemanticError or SectionError
 */
[[nodiscard]] OrchestrationModel load_orchestration(
  const std::filesystem::path & path, DiagnosticBag * diags = nullptr);

/// Same as load_orchestration() for text already in memory
[[nodiscard]] OrchestrationModel load_orchestration_from_text(
  std::string_view text, std::string_view source_name, DiagnosticBag * diags = nullptr);

/// Build a model from a parsed designer document
[[nodiscard]] OrchestrationModel build_orchestration(
  const tinyxml2::XMLDocument & doc, std::string_view source_name,
  DiagnosticBag * diags = nullptr);

}  // namespace odx
