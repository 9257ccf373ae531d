// test_project_config.cpp - Unit tests for odxm.yaml loading
//
#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "odx/project/project_config.hpp"
#include "odx/test_support/odx_builders.hpp"

namespace odx
{

namespace fs = std::filesystem;

class ProjectConfigTest : public ::testing::Test
{
protected:
  ProjectConfigTest() : dir_(fs::temp_directory_path() / "odx_project_config_test") {}

  fs::path write_config(const std::string & yaml)
  {
    const fs::path path = dir_.path / k_project_config_file_name;
    test_support::write_file(path, yaml);
    return path;
  }

  test_support::TempDir dir_;
};

TEST_F(ProjectConfigTest, FullConfig)
{
  const auto path = write_config(
    "project:\n"
    "  name: billing\n"
    "analysis:\n"
    "  input_dir: orchestrations\n"
    "  extensions: [\".odx\", \".ODX\"]\n"
    "  recursive: true\n"
    "report:\n"
    "  output: out/report.json\n"
    "  top_shapes: 5\n");

  auto result = load_project_config(path);
  ASSERT_TRUE(result.success) << result.error;
  const ProjectConfig & cfg = result.config;

  EXPECT_EQ(cfg.project.name, "billing");
  EXPECT_EQ(cfg.analysis.extensions, (std::vector<std::string>{".odx", ".ODX"}));
  EXPECT_TRUE(cfg.analysis.recursive);
  EXPECT_EQ(cfg.report.top_shapes, 5);

  const fs::path root = fs::absolute(dir_.path);
  EXPECT_EQ(cfg.project_root.string(), root.string());
  EXPECT_EQ(
    cfg.resolved_input_dir().string(), (root / "orchestrations").lexically_normal().string());
  ASSERT_TRUE(cfg.resolved_report_output().has_value());
  EXPECT_EQ(
    cfg.resolved_report_output()->string(),
    (root / "out/report.json").lexically_normal().string());
}

TEST_F(ProjectConfigTest, DefaultsWhenSectionsMissing)
{
  const auto path = write_config("project:\n  name: minimal\n");

  auto result = load_project_config(path);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.analysis.extensions, (std::vector<std::string>{".odx"}));
  EXPECT_FALSE(result.config.analysis.recursive);
  EXPECT_EQ(result.config.report.top_shapes, 20);
  EXPECT_FALSE(result.config.resolved_report_output().has_value());
}

TEST_F(ProjectConfigTest, AbsoluteInputDirIsKept)
{
  const fs::path abs = fs::absolute(dir_.path / "elsewhere");
  const auto path = write_config("analysis:\n  input_dir: \"" + abs.generic_string() + "\"\n");

  auto result = load_project_config(path);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.resolved_input_dir().generic_string(), abs.generic_string());
}

TEST_F(ProjectConfigTest, MissingFile)
{
  auto result = load_project_config(dir_.path / "nope.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("configuration file not found"), std::string::npos);
}

TEST_F(ProjectConfigTest, MalformedYaml)
{
  const auto path = write_config("analysis: [unclosed\n");
  auto result = load_project_config(path);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("failed to parse YAML"), std::string::npos);
}

TEST_F(ProjectConfigTest, ExtensionWithoutDotRejected)
{
  const auto path = write_config("analysis:\n  extensions: [odx]\n");
  auto result = load_project_config(path);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "invalid extension 'odx' (must start with '.')");
}

TEST_F(ProjectConfigTest, ExtensionsMustBeList)
{
  const auto path = write_config("analysis:\n  extensions: .odx\n");
  auto result = load_project_config(path);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "analysis.extensions must be a list");
}

TEST_F(ProjectConfigTest, NonPositiveTopShapesRejected)
{
  const auto path = write_config("report:\n  top_shapes: 0\n");
  auto result = load_project_config(path);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "invalid report.top_shapes: 0 (must be a positive integer)");
}

TEST_F(ProjectConfigTest, BadValueType)
{
  const auto path = write_config("analysis:\n  recursive: maybe\n");
  auto result = load_project_config(path);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("invalid configuration value"), std::string::npos);
}

TEST_F(ProjectConfigTest, FindSearchesUpward)
{
  const auto path = write_config("project:\n  name: up\n");
  const fs::path nested = dir_.path / "a" / "b";
  fs::create_directories(nested);

  auto found = find_project_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::weakly_canonical(*found).string(), fs::weakly_canonical(path).string());
}

TEST_F(ProjectConfigTest, FindAcceptsFilePath)
{
  const auto path = write_config("project:\n  name: up\n");
  const fs::path file = dir_.path / "Orders.odx";
  test_support::write_file(file, "x");

  auto found = find_project_config(file);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::weakly_canonical(*found).string(), fs::weakly_canonical(path).string());
}

}  // namespace odx
