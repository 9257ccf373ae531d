// odx/project/project_config.hpp - Project configuration (odxm.yaml)
//
// Parses and validates odxm.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace odx
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Analysis section: which files a directory scan picks up.
 */
struct AnalysisConfig
{
  /// Directory holding orchestration files (relative to odxm.yaml)
  std::filesystem::path input_dir = ".";

  /// File extensions considered orchestration files (each starts with '.')
  std::vector<std::string> extensions = {".odx"};

  /// Descend into subdirectories
  bool recursive = false;
};

/**
 * Report section.
 */
struct ReportConfig
{
  /// JSON report destination; console only when unset
  std::optional<std::filesystem::path> output;

  /// Number of rows in the shape frequency table
  int top_shapes = 20;
};

struct ProjectInfo
{
  std::string name;
};

/**
 * Complete project configuration (odxm.yaml).
 */
struct ProjectConfig
{
  ProjectInfo project;
  AnalysisConfig analysis;
  ReportConfig report;

  /// Directory containing odxm.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// input_dir resolved against project_root
  [[nodiscard]] std::filesystem::path resolved_input_dir() const;

  /// report.output resolved against project_root, if set
  [[nodiscard]] std::optional<std::filesystem::path> resolved_report_output() const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from an odxm.yaml file.
 *
 * @param config_path Path to odxm.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory to start searching from
 * @return Path to odxm.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "odxm.yaml";

}  // namespace odx
