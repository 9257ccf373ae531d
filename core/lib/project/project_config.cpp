// odx/project/project_config.cpp - Project configuration implementation
//
#include "odx/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace odx
{

namespace
{

/// Parse analysis.extensions; every entry must look like ".odx"
bool parse_extensions(
  const YAML::Node & node, std::vector<std::string> & out, std::string & error)
{
  if (!node.IsSequence()) {
    error = "analysis.extensions must be a list";
    return false;
  }
  out.clear();
  for (const auto & ext_node : node) {
    if (!ext_node.IsScalar()) {
      error = "analysis.extensions entries must be strings";
      return false;
    }
    auto ext = ext_node.as<std::string>();
    if (ext.size() < 2 || ext.front() != '.') {
      error = "invalid extension '" + ext + "' (must start with '.')";
      return false;
    }
    out.push_back(std::move(ext));
  }
  return true;
}

}  // namespace

std::filesystem::path ProjectConfig::resolved_input_dir() const
{
  if (analysis.input_dir.is_absolute()) {
    return analysis.input_dir;
  }
  return (project_root / analysis.input_dir).lexically_normal();
}

std::optional<std::filesystem::path> ProjectConfig::resolved_report_output() const
{
  if (!report.output) {
    return std::nullopt;
  }
  if (report.output->is_absolute()) {
    return report.output;
  }
  return (project_root / *report.output).lexically_normal();
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    // Parse 'project' section
    if (root["project"]) {
      const auto & proj = root["project"];
      if (proj["name"]) {
        config.project.name = proj["name"].as<std::string>();
      }
    }

    // Parse 'analysis' section
    if (root["analysis"]) {
      const auto & an = root["analysis"];

      if (an["input_dir"]) {
        config.analysis.input_dir = an["input_dir"].as<std::string>();
      }

      if (an["extensions"]) {
        std::string ext_error;
        if (!parse_extensions(an["extensions"], config.analysis.extensions, ext_error)) {
          return ConfigLoadResult::fail(ext_error);
        }
      }

      if (an["recursive"]) {
        config.analysis.recursive = an["recursive"].as<bool>();
      }
    }

    // Parse 'report' section
    if (root["report"]) {
      const auto & rep = root["report"];

      if (rep["output"]) {
        config.report.output = rep["output"].as<std::string>();
      }

      if (rep["top_shapes"]) {
        config.report.top_shapes = rep["top_shapes"].as<int>();
        if (config.report.top_shapes <= 0) {
          return ConfigLoadResult::fail(
            "invalid report.top_shapes: " + std::to_string(config.report.top_shapes) +
            " (must be a positive integer)");
        }
      }
    }
  } catch (const YAML::Exception & e) {
    // Type conversion failures (e.g. recursive: maybe)
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace odx
