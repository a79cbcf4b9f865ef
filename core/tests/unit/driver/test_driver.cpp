#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

#include "sysml_lite/driver/driver.hpp"
#include "sysml_lite/test_support/parse_helpers.hpp"

using namespace sysml_lite;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

void write_file(const std::filesystem::path & p, const std::string & content)
{
  std::ofstream f(p);
  f << content;
}

std::string read_file(const std::filesystem::path & p)
{
  std::ifstream f(p);
  std::stringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

}  // namespace

TEST(Driver, CheckParsesWithoutWriting)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "sysml_driver_check");
  const auto file = dir.path / "vehicle.sysml";
  write_file(file, "package Vehicle { part Engine; }\n");

  DriverOptions options;
  const auto result = Driver::parse_file(file, options);

  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.empty());
  ASSERT_EQ(result.documents.size(), 1U);
  ASSERT_NE(result.documents[0].model, nullptr);
  EXPECT_EQ(result.documents[0].model->elements.size(), 1U);
  EXPECT_TRUE(result.generated_files.empty());
  EXPECT_FALSE(std::filesystem::exists(dir.path / "vehicle.json"));
}

TEST(Driver, BuildWritesJsonNextToInput)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "sysml_driver_build");
  const auto file = dir.path / "vehicle.sysml";
  write_file(file, "package Vehicle { attribute mass : Real = 1500.0; }\n");

  DriverOptions options;
  options.mode = DriverMode::Build;
  const auto result = Driver::parse_file(file, options);

  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.generated_files.size(), 1U);
  EXPECT_EQ(result.generated_files[0].filename().string(), "vehicle.json");

  const auto j = nlohmann::json::parse(read_file(result.generated_files[0]));
  EXPECT_EQ(j["type"], "root");
  ASSERT_EQ(j["children"].size(), 1);
  EXPECT_EQ(j["children"][0]["children"][0]["properties"]["defaultValue"], 1500.0);
}

TEST(Driver, BuildWritesTreeIntoOutputDir)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "sysml_driver_tree");
  const auto file = dir.path / "m.sysml";
  write_file(file, "part A;\n");

  DriverOptions options;
  options.mode = DriverMode::Build;
  options.format = OutputFormat::Tree;
  options.output_dir = dir.path / "out";
  const auto result = Driver::parse_file(file, options);

  ASSERT_TRUE(result.success);
  const auto expected_path = dir.path / "out" / "m.ast.txt";
  ASSERT_TRUE(std::filesystem::exists(expected_path));
  EXPECT_EQ(read_file(expected_path), "Model\n`-Part name='A'\n");
}

TEST(Driver, MissingFileIsReported)
{
  DriverOptions options;
  const auto result = Driver::parse_file(
    std::filesystem::temp_directory_path() / "sysml_driver_none" / "missing.sysml", options);

  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.documents.empty());
  ASSERT_EQ(result.diagnostics.size(), 1U);
  EXPECT_EQ(result.diagnostics.items()[0].code, DiagCode::FileNotFound);
}

TEST(Driver, PartialModelIsStillWritten)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "sysml_driver_partial");
  const auto file = dir.path / "broken.sysml";
  write_file(file, "part A;\npackage P {\n");

  DriverOptions options;
  options.mode = DriverMode::Build;
  options.format = OutputFormat::Tree;
  const auto result = Driver::parse_file(file, options);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.diagnostics.error_count(), 1U);
  ASSERT_EQ(result.generated_files.size(), 1U);
  EXPECT_EQ(read_file(result.generated_files[0]), "Model\n`-Part name='A'\n");
}

TEST(Driver, BuildProjectSkipsMissingSources)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "sysml_driver_project");
  write_file(dir.path / "a.sysml", "part A;\n");
  write_file(dir.path / "b.sysml", "port p : P;\n");

  ProjectConfig config;
  config.project_root = dir.path;
  config.sources = {"a.sysml", "missing.sysml", "b.sysml"};
  config.output.dir = "gen";

  DriverOptions options;
  options.mode = DriverMode::Build;
  const auto result = Driver::build_project(config, options);

  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.size(), 1U);
  EXPECT_EQ(result.diagnostics.items()[0].code, DiagCode::FileNotFound);

  ASSERT_EQ(result.documents.size(), 2U);
  ASSERT_EQ(result.generated_files.size(), 2U);
  EXPECT_TRUE(std::filesystem::exists(dir.path / "gen" / "a.json"));
  EXPECT_TRUE(std::filesystem::exists(dir.path / "gen" / "b.json"));
}

TEST(Driver, BuildProjectMirrorsSourceDirectories)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "sysml_driver_mirror");
  std::filesystem::create_directories(dir.path / "a");
  std::filesystem::create_directories(dir.path / "b");
  write_file(dir.path / "a" / "v.sysml", "part A;\n");
  write_file(dir.path / "b" / "v.sysml", "part B;\n");

  ProjectConfig config;
  config.project_root = dir.path;
  config.sources = {"a/v.sysml", "b/v.sysml"};
  config.output.dir = "gen";
  config.output.format = OutputFormat::Tree;

  DriverOptions options;
  options.mode = DriverMode::Build;
  const auto result = Driver::build_project(config, options);

  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.empty());
  ASSERT_EQ(result.generated_files.size(), 2U);
  EXPECT_EQ(read_file(dir.path / "gen" / "a" / "v.ast.txt"), "Model\n`-Part name='A'\n");
  EXPECT_EQ(read_file(dir.path / "gen" / "b" / "v.ast.txt"), "Model\n`-Part name='B'\n");
}

TEST(Driver, OutputCollisionIsReported)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "sysml_driver_collision");
  std::filesystem::create_directories(dir.path / "proj");
  std::filesystem::create_directories(dir.path / "other");
  write_file(dir.path / "proj" / "v.sysml", "part A;\n");
  write_file(dir.path / "other" / "v.sysml", "part B;\n");

  // The second source lies outside the project root, so it maps to gen/v.json too.
  ProjectConfig config;
  config.project_root = dir.path / "proj";
  config.sources = {"v.sysml", dir.path / "other" / "v.sysml"};
  config.output.dir = "gen";

  DriverOptions options;
  options.mode = DriverMode::Build;
  const auto result = Driver::build_project(config, options);

  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.size(), 1U);
  EXPECT_EQ(result.diagnostics.items()[0].code, DiagCode::OutputError);
  EXPECT_EQ(result.documents.size(), 2U);
  ASSERT_EQ(result.generated_files.size(), 1U);

  // The first output is left as written.
  const auto j = nlohmann::json::parse(read_file(dir.path / "proj" / "gen" / "v.json"));
  EXPECT_EQ(j["children"][0]["properties"]["name"], "A");
}

TEST(Driver, JsonReplacesInvalidUtf8)
{
  auto unit = test_support::parse("attribute a = \"\xff\xfe\";\n");
  ASSERT_EQ(unit.model->elements.size(), 1U);

  std::string text;
  ASSERT_NO_THROW(text = Driver::render(unit.model, OutputFormat::Json));
  EXPECT_NE(text.find("\xEF\xBF\xBD"), std::string::npos) << text;
  EXPECT_EQ(text.find('\xff'), std::string::npos);

  const auto j = nlohmann::json::parse(text);
  const auto value = j["children"][0]["properties"]["defaultValue"].get<std::string>();
  EXPECT_EQ(value.rfind("\xEF\xBF\xBD", 0), 0U);
}

TEST(Driver, EmptyProjectWarns)
{
  ProjectConfig config;
  config.project_root = std::filesystem::temp_directory_path();

  const auto result = Driver::build_project(config, DriverOptions{});
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.diagnostics.warning_count(), 1U);
}
