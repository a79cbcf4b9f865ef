// sysml_lite/project/project_config.cpp - Project configuration implementation
//
#include "sysml_lite/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <utility>
#include <vector>

namespace sysml_lite
{

std::optional<OutputFormat> parse_output_format(std::string_view text)
{
  if (text == "json") {
    return OutputFormat::Json;
  }
  if (text == "tree") {
    return OutputFormat::Tree;
  }
  return std::nullopt;
}

std::string_view to_string(OutputFormat format) noexcept
{
  switch (format) {
    case OutputFormat::Json:
      return "json";
    case OutputFormat::Tree:
      return "tree";
  }
  return "json";
}

std::string_view output_extension(OutputFormat format) noexcept
{
  switch (format) {
    case OutputFormat::Json:
      return ".json";
    case OutputFormat::Tree:
      return ".ast.txt";
  }
  return ".json";
}

namespace
{

namespace fs = std::filesystem;

/// Errors are plain messages; the caller adds the file name.
using SectionError = std::optional<std::string>;

/// `map[key]` as a string, or nullopt when the key is absent.
std::optional<std::string> scalar(const YAML::Node & map, const char * key)
{
  const YAML::Node node = map[key];
  if (!node) {
    return std::nullopt;
  }
  return node.as<std::string>();
}

SectionError read_package(const YAML::Node & node, PackageConfig & package)
{
  if (!node.IsMap()) {
    return std::string("package must be a map");
  }
  package.name = scalar(node, "name").value_or("");
  package.version = scalar(node, "version").value_or("");
  return std::nullopt;
}

SectionError read_sources(const YAML::Node & node, std::vector<fs::path> & sources)
{
  if (!node.IsSequence()) {
    return std::string("sources must be a list");
  }
  for (const auto & entry : node) {
    sources.emplace_back(entry.as<std::string>());
  }
  return std::nullopt;
}

SectionError read_output(const YAML::Node & node, OutputConfig & output)
{
  if (!node.IsMap()) {
    return std::string("output must be a map");
  }
  if (auto dir = scalar(node, "dir")) {
    output.dir = std::move(*dir);
  }
  if (const auto text = scalar(node, "format")) {
    const auto format = parse_output_format(*text);
    if (!format) {
      return "invalid output.format: '" + *text + "' (must be 'json' or 'tree')";
    }
    output.format = *format;
  }
  return std::nullopt;
}

/// Sections may appear in any order; absent ones keep their defaults.
SectionError read_config(const YAML::Node & root, ProjectConfig & config)
{
  // An empty file is a project with default settings.
  if (root.IsNull()) {
    return std::nullopt;
  }
  if (!root.IsMap()) {
    return std::string("top level of the configuration must be a map");
  }

  SectionError error;
  if (const YAML::Node package = root["package"]) {
    error = read_package(package, config.package);
  }
  if (const YAML::Node sources = root["sources"]; sources && !error) {
    error = read_sources(sources, config.sources);
  }
  if (const YAML::Node output = root["output"]; output && !error) {
    error = read_output(output, config.output);
  }
  return error;
}

}  // namespace

ConfigLoadResult load_project_config(const fs::path & config_path)
{
  if (!fs::is_regular_file(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  // yaml-cpp throws both for syntax errors and for scalar conversions that
  // do not fit (a map where a string is expected).
  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());
    try {
      if (auto error = read_config(root, config)) {
        return ConfigLoadResult::fail(std::move(*error));
      }
    } catch (const YAML::Exception & e) {
      return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
    }
  } catch (const YAML::ParserException & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to read configuration: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<fs::path> find_project_config(const fs::path & start_dir)
{
  fs::path dir = fs::absolute(start_dir);
  if (fs::is_regular_file(dir)) {
    dir = dir.parent_path();
  }

  // Walk up until the root, whose parent is itself.
  for (;;) {
    fs::path candidate = dir / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }
    if (dir.parent_path() == dir) {
      return std::nullopt;
    }
    dir = dir.parent_path();
  }
}

}  // namespace sysml_lite
