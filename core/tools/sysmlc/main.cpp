// sysmlc - SysML v2 (subset) front end command line interface
//
// Usage:
//   sysmlc tokens <file.sysml> [-o output]
//   sysmlc parse <file.sysml> [--format tree|json] [-o output]
//   sysmlc check [file.sysml | --project]
//   sysmlc build [file.sysml | --project] [-o output-dir] [--format tree|json]
//
#include <fmt/core.h>

#include <array>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "sysml_lite/basic/diagnostic_printer.hpp"
#include "sysml_lite/driver/driver.hpp"
#include "sysml_lite/project/project_config.hpp"
#include "sysml_lite/syntax/lexer.hpp"

namespace fs = std::filesystem;
using namespace sysml_lite;

namespace
{

enum class Command { Tokens, Parse, Check, Build };

struct CommandInfo
{
  std::string_view name;
  Command command;
  std::string_view synopsis;
  std::string_view summary;
};

constexpr std::array<CommandInfo, 4> k_commands{{
  {"tokens", Command::Tokens, "tokens <file.sysml>", "Print the token stream"},
  {"parse", Command::Parse, "parse <file.sysml>", "Print the AST"},
  {"check", Command::Check, "check [file.sysml]", "Parse and report diagnostics only"},
  {"build", Command::Build, "build [file.sysml]", "Parse a file or project and write outputs"},
}};

const CommandInfo * find_command(std::string_view name)
{
  for (const auto & info : k_commands) {
    if (info.name == name) {
      return &info;
    }
  }
  return nullptr;
}

void print_usage(std::string_view program)
{
  std::cerr << "SysML v2 subset front end v0.1.0\n\n"
            << fmt::format("Usage: {} <command> [options]\n\nCommands:\n", program);
  for (const auto & info : k_commands) {
    std::cerr << fmt::format("  {:<24} {}\n", info.synopsis, info.summary);
  }
  std::cerr << "\nOptions:\n"
            << "  -o, --output <path>      Output file (tokens, parse) or directory (build)\n"
            << "  --format <tree|json>     Output format (parse: tree, build: from sysml.yaml)\n"
            << "  --project                Use the project from sysml.yaml\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

/// One command line, already validated.
struct Invocation
{
  Command command = Command::Check;
  std::optional<fs::path> input;
  std::optional<fs::path> output;
  std::optional<OutputFormat> format;
  bool project = false;
  bool color = true;
  bool verbose = false;
};

/// Outcome of reading argv: run `invocation`, print help, or report `error`.
struct CommandLine
{
  Invocation invocation;
  bool help = false;
  std::string error;
};

CommandLine read_command_line(int argc, char * argv[])
{
  CommandLine cl;
  if (argc < 2) {
    cl.help = true;
    return cl;
  }

  const std::string_view name = argv[1];
  if (name == "-h" || name == "--help") {
    cl.help = true;
    return cl;
  }
  const CommandInfo * info = find_command(name);
  if (info == nullptr) {
    cl.error = fmt::format("unknown command '{}'", name);
    return cl;
  }

  Invocation & inv = cl.invocation;
  inv.command = info->command;

  for (int i = 2; i < argc; ++i) {
    const std::string_view arg = argv[i];
    const bool takes_value = arg == "-o" || arg == "--output" || arg == "--format";
    if (takes_value && i + 1 >= argc) {
      cl.error = fmt::format("missing value for {}", arg);
      return cl;
    }

    if (arg == "-o" || arg == "--output") {
      inv.output = fs::path(argv[++i]);
    } else if (arg == "--format") {
      const std::string_view value = argv[++i];
      inv.format = parse_output_format(value);
      if (!inv.format) {
        cl.error = fmt::format("invalid --format '{}' (must be 'tree' or 'json')", value);
        return cl;
      }
    } else if (arg == "--project") {
      inv.project = true;
    } else if (arg == "--no-color") {
      inv.color = false;
    } else if (arg == "-v" || arg == "--verbose") {
      inv.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      cl.help = true;
    } else if (!arg.empty() && arg[0] != '-' && !inv.input) {
      inv.input = fs::absolute(fs::path(arg));
    } else {
      cl.error = fmt::format("unexpected argument '{}'", arg);
      return cl;
    }
  }

  if ((inv.command == Command::Tokens || inv.command == Command::Parse) && !inv.input) {
    cl.error = fmt::format("{} needs an input file", info->name);
  }
  return cl;
}

// ============================================================================
// Reporting
// ============================================================================

void report(const DiagnosticBag & diags, const SourceRegistry & sources, const Invocation & inv)
{
  if (diags.empty()) {
    return;
  }
  DiagnosticPrinter printer(std::cerr, inv.color && isatty(fileno(stderr)) != 0);
  printer.print_all(diags, sources);
  printer.print_summary(diags);
}

/// Write `text` to -o when given, stdout otherwise.
bool emit(const Invocation & inv, const std::string & text)
{
  if (!inv.output) {
    std::cout << text;
    return true;
  }
  std::ofstream out(*inv.output, std::ios::binary);
  if (!out.is_open()) {
    std::cerr << "error: failed to open output file: " << inv.output->string() << "\n";
    return false;
  }
  out << text;
  if (inv.verbose) {
    std::cerr << "Wrote: " << inv.output->string() << "\n";
  }
  return true;
}

/// sysml.yaml from the working directory or one of its parents.
std::optional<ProjectConfig> load_project(const Invocation & inv)
{
  DiagnosticBag diags;
  const auto config_path = find_project_config(fs::current_path());
  if (!config_path) {
    diags
      .error(
        SourceRange{},
        fmt::format("no {} found in current directory or parents", k_project_config_file_name))
      .code(DiagCode::ConfigError);
    report(diags, SourceRegistry{}, inv);
    return std::nullopt;
  }

  auto loaded = load_project_config(*config_path);
  if (!loaded.success) {
    diags.error(SourceRange{}, fmt::format("{}: {}", config_path->string(), loaded.error))
      .code(DiagCode::ConfigError);
    report(diags, SourceRegistry{}, inv);
    return std::nullopt;
  }

  if (inv.verbose) {
    std::cerr << "Using project: " << config_path->string() << "\n";
  }
  return std::move(loaded.config);
}

/// Run the driver over the named file, or over the project when there is none.
/// `subject` receives what was processed: the file, or the package name.
std::optional<DriverResult> run_driver(
  const Invocation & inv, const DriverOptions & options, std::string & subject)
{
  if (inv.input && !inv.project) {
    subject = inv.input->string();
    return Driver::parse_file(*inv.input, options);
  }
  const auto config = load_project(inv);
  if (!config) {
    return std::nullopt;
  }
  subject = config->package.name.empty() ? "project" : config->package.name;
  return Driver::build_project(*config, options);
}

// ============================================================================
// Commands
// ============================================================================

int run_tokens(const Invocation & inv)
{
  std::ifstream file(*inv.input, std::ios::binary);
  if (!file.is_open()) {
    std::cerr << "error: failed to open file: " << inv.input->string() << "\n";
    return 1;
  }
  std::ostringstream text;
  text << file.rdbuf();

  std::string listing;
  for (const auto & tok : syntax::tokenize(text.str())) {
    listing += fmt::format(
      "{:<12} {:>4}:{:<4} {}\n", syntax::to_string(tok.kind), tok.line, tok.column,
      syntax::format_value(tok.value));
  }
  return emit(inv, listing) ? 0 : 1;
}

int run_parse(const Invocation & inv)
{
  DriverOptions options;
  options.verbose = inv.verbose;

  const DriverResult result = Driver::parse_file(*inv.input, options);
  report(result.diagnostics, result.sources, inv);

  // A partial model is still printed after a parse failure.
  if (!result.documents.empty()) {
    const Model * model = result.documents.front().model;
    if (!emit(inv, Driver::render(model, inv.format.value_or(OutputFormat::Tree)))) {
      return 1;
    }
  }
  return result.success ? 0 : 1;
}

int run_check(const Invocation & inv)
{
  DriverOptions options;
  options.verbose = inv.verbose;

  std::string subject;
  const auto result = run_driver(inv, options, subject);
  if (!result) {
    return 1;
  }
  report(result->diagnostics, result->sources, inv);
  if (!result->success) {
    return 1;
  }
  std::cout << subject << ": OK\n";
  return 0;
}

int run_build(const Invocation & inv)
{
  DriverOptions options;
  options.mode = DriverMode::Build;
  options.verbose = inv.verbose;
  options.format = inv.format;
  if (inv.output) {
    options.output_dir = fs::absolute(*inv.output);
  }

  std::string subject;
  const auto result = run_driver(inv, options, subject);
  if (!result) {
    return 1;
  }
  report(result->diagnostics, result->sources, inv);
  for (const auto & file : result->generated_files) {
    std::cerr << "Generated: " << file.string() << "\n";
  }
  return result->success ? 0 : 1;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandLine cl = read_command_line(argc, argv);
  if (cl.help) {
    print_usage(argv[0]);
    return 0;
  }
  if (!cl.error.empty()) {
    std::cerr << "error: " << cl.error << "\n";
    print_usage(argv[0]);
    return 1;
  }

  switch (cl.invocation.command) {
    case Command::Tokens:
      return run_tokens(cl.invocation);
    case Command::Parse:
      return run_parse(cl.invocation);
    case Command::Check:
      return run_check(cl.invocation);
    case Command::Build:
      return run_build(cl.invocation);
  }
  return 1;
}
