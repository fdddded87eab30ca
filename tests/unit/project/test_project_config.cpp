// tests/unit/project/test_project_config.cpp - Unit tests for wirebind.yaml loading
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "wirebind/project/project_config.hpp"

using namespace wirebind;

namespace fs = std::filesystem;

namespace
{

class ProjectConfigTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    root_ = fs::temp_directory_path() /
            ("wirebind_project_" + std::string(
                                     ::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(root_);
    fs::create_directories(root_ / "schemas" / "nested");
  }

  void TearDown() override { fs::remove_all(root_); }

  fs::path write_config(const std::string & text)
  {
    const fs::path path = root_ / k_project_config_file_name;
    std::ofstream out(path);
    out << text;
    return path;
  }

  fs::path root_;
};

}  // namespace

TEST_F(ProjectConfigTest, LoadsAllSections)
{
  const auto path = write_config(R"(
package:
  name: library
  version: 0.3.0
generator:
  schemas: [schemas/library.wb.yaml, /abs/other.wb.yaml]
  output_dir: build/generated
  emit_plan_comments: true
side_channel:
  proto_files: [proto/library.proto]
  lookup_file: lookup.json
)");

  auto result = load_project_config(path);
  ASSERT_TRUE(result.success) << result.error;
  const ProjectConfig & cfg = result.config;

  EXPECT_EQ(cfg.package.name, "library");
  EXPECT_EQ(cfg.package.version, "0.3.0");
  ASSERT_EQ(cfg.generator.schemas.size(), 2U);
  EXPECT_EQ(cfg.generator.output_dir, fs::path("build/generated"));
  EXPECT_TRUE(cfg.generator.emit_plan_comments);
  ASSERT_EQ(cfg.side_channel.proto_files.size(), 1U);
  ASSERT_TRUE(cfg.side_channel.lookup_file.has_value());

  EXPECT_EQ(cfg.project_root, fs::absolute(path).parent_path());
  EXPECT_EQ(cfg.resolve(cfg.generator.schemas[0]), cfg.project_root / "schemas/library.wb.yaml");
  EXPECT_EQ(cfg.resolve(cfg.generator.schemas[1]), fs::path("/abs/other.wb.yaml"));
}

TEST_F(ProjectConfigTest, DefaultsWhenSectionsAreAbsent)
{
  auto result = load_project_config(write_config("generator:\n  schemas: [a.wb.yaml]\n"));
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.generator.output_dir, fs::path("generated"));
  EXPECT_FALSE(result.config.generator.emit_plan_comments);
  EXPECT_TRUE(result.config.side_channel.proto_files.empty());
  EXPECT_FALSE(result.config.side_channel.lookup_file.has_value());
}

TEST_F(ProjectConfigTest, RequiresSchemas)
{
  auto result = load_project_config(write_config("package:\n  name: empty\n"));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "generator.schemas must list at least one schema file");
}

TEST_F(ProjectConfigTest, RejectsMalformedLists)
{
  auto scalar = load_project_config(write_config("generator:\n  schemas: library.wb.yaml\n"));
  EXPECT_FALSE(scalar.success);
  EXPECT_EQ(scalar.error, "generator.schemas must be a list");

  auto nested = load_project_config(write_config(
    "generator:\n  schemas: [a.wb.yaml]\nside_channel:\n  proto_files: [[a.proto]]\n"));
  EXPECT_FALSE(nested.success);
  EXPECT_EQ(nested.error, "side_channel.proto_files entries must be strings");
}

TEST_F(ProjectConfigTest, RejectsBadScalarTypes)
{
  auto result = load_project_config(
    write_config("generator:\n  schemas: [a.wb.yaml]\n  emit_plan_comments: sometimes\n"));
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("failed to parse YAML"), std::string::npos);
}

TEST_F(ProjectConfigTest, MissingFile)
{
  auto result = load_project_config(root_ / "nope.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("configuration file not found"), std::string::npos);
}

TEST_F(ProjectConfigTest, FindsConfigUpwards)
{
  const auto config = write_config("generator:\n  schemas: [a.wb.yaml]\n");

  auto found = find_project_config(root_ / "schemas" / "nested");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(config));

  const auto schema = root_ / "schemas" / "nested" / "x.wb.yaml";
  std::ofstream(schema) << "aggregates: []\n";
  auto from_file = find_project_config(schema);
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(fs::canonical(*from_file), fs::canonical(config));
}
