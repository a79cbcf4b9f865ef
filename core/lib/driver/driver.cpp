// sysml_lite/driver/driver.cpp - Parse/build driver implementation
//
#include "sysml_lite/driver/driver.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "sysml_lite/ast/ast_dumper.hpp"
#include "sysml_lite/ast/json_visitor.hpp"
#include "sysml_lite/syntax/frontend.hpp"

namespace sysml_lite
{

namespace fs = std::filesystem;

bool Driver::load_and_parse(
  const fs::path & file, const DriverOptions & options, DriverResult & result)
{
  if (!fs::exists(file)) {
    result.diagnostics.error(SourceRange{}, "file not found: " + file.string())
      .code(DiagCode::FileNotFound);
    return false;
  }

  std::ifstream in(file, std::ios::binary);
  if (!in.is_open()) {
    result.diagnostics.error(SourceRange{}, "failed to open file: " + file.string())
      .code(DiagCode::FileUnreadable);
    return false;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    result.diagnostics.error(SourceRange{}, "failed to read file: " + file.string())
      .code(DiagCode::FileUnreadable);
    return false;
  }

  if (options.verbose) {
    fmt::print(stderr, "Parsing: {}\n", file.string());
  }

  ParsedDocument doc;
  doc.path = file;
  doc.ast = std::make_unique<AstContext>();
  const ParseOutput out =
    parse_source(result.sources, file, buffer.str(), *doc.ast, result.diagnostics);
  doc.file_id = out.file_id;
  doc.model = out.model;
  result.documents.push_back(std::move(doc));
  return true;
}

std::string Driver::render(const Model * model, OutputFormat format)
{
  switch (format) {
    case OutputFormat::Json:
      // Names may hold any byte the lexer accepted; invalid UTF-8 becomes U+FFFD.
      return to_json(model).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
    case OutputFormat::Tree:
      return dump_to_string(model);
  }
  return {};
}

fs::path Driver::output_path_for(
  const fs::path & source, const fs::path & base_dir, const fs::path & output_dir,
  OutputFormat format)
{
  fs::path rel = fs::absolute(source).lexically_normal().lexically_relative(
    fs::absolute(base_dir).lexically_normal());

  // Sources outside base_dir keep only their file name.
  if (rel.empty() || *rel.begin() == "..") {
    rel = source.filename();
  }
  rel.replace_extension();
  return output_dir / (rel.string() + std::string(output_extension(format)));
}

void Driver::write_output(
  const ParsedDocument & doc, const fs::path & output_path, OutputFormat format,
  DriverResult & result)
{
  const auto & written = result.generated_files;
  if (std::find(written.begin(), written.end(), output_path) != written.end()) {
    result.diagnostics
      .error(
        SourceRange{}, fmt::format(
                         "output {} for {} would overwrite the output of an earlier source",
                         output_path.string(), doc.path.string()))
      .code(DiagCode::OutputError);
    return;
  }

  std::error_code ec;
  fs::create_directories(output_path.parent_path(), ec);
  if (ec) {
    result.diagnostics
      .error(
        SourceRange{}, fmt::format(
                         "failed to create output directory {}: {}",
                         output_path.parent_path().string(), ec.message()))
      .code(DiagCode::OutputError);
    return;
  }

  std::ofstream out(output_path, std::ios::binary);
  if (!out.is_open()) {
    result.diagnostics.error(SourceRange{}, "failed to open output file: " + output_path.string())
      .code(DiagCode::OutputError);
    return;
  }
  out << render(doc.model, format);
  out.close();
  if (!out) {
    result.diagnostics.error(SourceRange{}, "failed to write output file: " + output_path.string())
      .code(DiagCode::OutputError);
    return;
  }

  result.generated_files.push_back(output_path);
}

DriverResult Driver::parse_file(const fs::path & file, const DriverOptions & options)
{
  DriverResult result;

  if (load_and_parse(file, options, result) && options.mode == DriverMode::Build) {
    const fs::path base_dir = fs::absolute(file).parent_path();
    const OutputFormat format = options.format.value_or(OutputFormat::Json);
    // Partial models are written too; the diagnostics say what is missing.
    write_output(
      result.documents.back(),
      output_path_for(file, base_dir, options.output_dir.value_or(base_dir), format), format,
      result);
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

DriverResult Driver::build_project(const ProjectConfig & config, const DriverOptions & options)
{
  DriverResult result;

  if (config.sources.empty()) {
    result.diagnostics.warning(SourceRange{}, "no sources listed in project configuration");
  }

  const fs::path output_dir = options.output_dir.value_or(config.resolve(config.output.dir));
  const OutputFormat format = options.format.value_or(config.output.format);

  if (options.verbose && !config.package.name.empty()) {
    fmt::print(stderr, "Project: {} {}\n", config.package.name, config.package.version);
  }

  // Outputs mirror the source layout under the project root.
  for (const auto & source : config.sources) {
    const fs::path path = config.resolve(source);
    if (!load_and_parse(path, options, result)) {
      continue;
    }
    if (options.mode == DriverMode::Build) {
      write_output(
        result.documents.back(), output_path_for(path, config.project_root, output_dir, format),
        format, result);
    }
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

}  // namespace sysml_lite
