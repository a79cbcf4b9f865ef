// sysml_lite/project/project_config.hpp - Project configuration (sysml.yaml)
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sysml_lite
{

/// Serialization written for each parsed source.
enum class OutputFormat {
  Json,  ///< <stem>.json, the {"type","properties","children"} tree
  Tree,  ///< <stem>.ast.txt, the AstDumper rendering
};

[[nodiscard]] std::optional<OutputFormat> parse_output_format(std::string_view text);
[[nodiscard]] std::string_view to_string(OutputFormat format) noexcept;

/// File extension (including the dot) used for an output format.
[[nodiscard]] std::string_view output_extension(OutputFormat format) noexcept;

/// `output:` section.
struct OutputConfig
{
  /// Relative to the project root unless absolute.
  std::filesystem::path dir = "generated";
  OutputFormat format = OutputFormat::Json;
};

/// `package:` section. Informational; shown in verbose and check output.
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * A parsed sysml.yaml.
 *
 * @code
 *   package:
 *     name: vehicle
 *     version: 0.1.0
 *   sources:
 *     - model/vehicle.sysml
 *   output:
 *     dir: generated
 *     format: tree
 * @endcode
 */
struct ProjectConfig
{
  PackageConfig package;
  std::vector<std::filesystem::path> sources;
  OutputConfig output;

  /// Directory holding sysml.yaml; relative `sources` and `output.dir` start here.
  std::filesystem::path project_root;

  [[nodiscard]] std::filesystem::path resolve(const std::filesystem::path & p) const
  {
    return p.is_absolute() ? p : project_root / p;
  }
};

/// Either a configuration or the reason there is none.
struct ConfigLoadResult
{
  ProjectConfig config;
  bool success = false;
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
    return r;
  }
};

/**
 * Read `config_path`.
 *
 * Malformed YAML, a section of the wrong shape or an unknown output format
 * come back as `error`; nothing is thrown.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/// Nearest sysml.yaml in `start_dir` or one of its ancestors.
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "sysml.yaml";

}  // namespace sysml_lite
