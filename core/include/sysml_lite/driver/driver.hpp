// sysml_lite/driver/driver.hpp - Parse/build driver
//
// Single entry point for running the front end over files or a project.
// Used by the CLI and usable from other tools.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sysml_lite/ast/ast.hpp"
#include "sysml_lite/ast/ast_context.hpp"
#include "sysml_lite/basic/diagnostic.hpp"
#include "sysml_lite/basic/source_manager.hpp"
#include "sysml_lite/project/project_config.hpp"

namespace sysml_lite
{

enum class DriverMode {
  Check,  ///< Parse and report diagnostics only
  Build,  ///< Also write one output file per source
};

struct DriverOptions
{
  DriverMode mode = DriverMode::Check;

  /// Output directory (overrides project config; single files default to their own directory)
  std::optional<std::filesystem::path> output_dir;

  /// Output format (overrides project config)
  std::optional<OutputFormat> format;

  bool verbose = false;
};

/**
 * One parsed source. Owns the arena its model lives in, so the model stays
 * valid for as long as the document does.
 */
struct ParsedDocument
{
  std::filesystem::path path;
  FileId file_id = FileId::invalid();
  std::unique_ptr<AstContext> ast;
  Model * model = nullptr;
};

struct DriverResult
{
  /// True when no error diagnostics were produced
  bool success = false;

  DiagnosticBag diagnostics;

  /// Every source that was read, for diagnostic rendering
  SourceRegistry sources;

  /// Parsed documents in input order (also the partial ones)
  std::vector<ParsedDocument> documents;

  /// Files written in Build mode
  std::vector<std::filesystem::path> generated_files;
};

class Driver
{
public:
  /**
   * Parse a single source file.
   *
   * In Build mode the result is written to `<stem>.json` or `<stem>.ast.txt`
   * inside options.output_dir, or next to the input when none is given.
   */
  [[nodiscard]] static DriverResult parse_file(
    const std::filesystem::path & file, const DriverOptions & options);

  /**
   * Parse every source listed in a project configuration.
   *
   * A missing or unreadable source is reported and skipped; the remaining
   * sources are still processed. In Build mode `model/a.sysml` is written to
   * `<output dir>/model/a.json`. Two sources mapping to the same output file
   * is an error; the first one written is kept.
   */
  [[nodiscard]] static DriverResult build_project(
    const ProjectConfig & config, const DriverOptions & options);

  /// Serialize a model in the given output format.
  [[nodiscard]] static std::string render(const Model * model, OutputFormat format);

private:
  /// Read and parse one file into result.documents; false if it could not be read.
  static bool load_and_parse(
    const std::filesystem::path & file, const DriverOptions & options, DriverResult & result);

  /// `source` relative to `base_dir`, moved under `output_dir` with the format's extension.
  [[nodiscard]] static std::filesystem::path output_path_for(
    const std::filesystem::path & source, const std::filesystem::path & base_dir,
    const std::filesystem::path & output_dir, OutputFormat format);

  /// Failures are reported to result.diagnostics.
  static void write_output(
    const ParsedDocument & doc, const std::filesystem::path & output_path, OutputFormat format,
    DriverResult & result);
};

}  // namespace sysml_lite
