// sysml_lite/basic/diagnostic_printer.cpp
#include "sysml_lite/basic/diagnostic_printer.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace sysml_lite
{
namespace
{

constexpr size_t k_tab_width = 4;

bool is_continuation_byte(char c) { return (static_cast<unsigned char>(c) & 0xC0) == 0x80; }

/// Terminal cells taken by `text`: one per character, k_tab_width per tab.
size_t display_width(std::string_view text)
{
  size_t width = 0;
  for (const char c : text) {
    if (c == '\t') {
      width += k_tab_width;
    } else if (!is_continuation_byte(c)) {
      ++width;
    }
  }
  return width;
}

std::string expand_tabs(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    if (c == '\t') {
      out.append(k_tab_width, ' ');
    } else {
      out += c;
    }
  }
  return out;
}

/// Path as the user would type it: relative to the working directory when possible.
std::string display_path(const std::filesystem::path & path)
{
  std::error_code ec;
  const auto rel = std::filesystem::relative(path, std::filesystem::current_path(), ec);
  return (ec || rel.empty()) ? path.string() : rel.string();
}

/// Byte offset of the first character of `line` within `file`.
uint32_t line_start(const SourceFile & file, std::string_view line)
{
  return static_cast<uint32_t>(line.data() - file.text().data());
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  rang::setControlMode(use_color_ ? rang::control::Force : rang::control::Off);
}

void DiagnosticPrinter::write(std::string_view text, Tone tone)
{
  if (!use_color_ || tone == Tone::Plain) {
    os_ << text;
    return;
  }

  os_ << rang::style::bold;
  switch (tone) {
    case Tone::Error:
      os_ << rang::fg::red;
      break;
    case Tone::Warning:
      os_ << rang::fg::yellow;
      break;
    case Tone::Accent:
      os_ << rang::fg::cyan;
      break;
    case Tone::Inserted:
      os_ << rang::fg::green;
      break;
    case Tone::Plain:
      break;
  }
  os_ << text << rang::fg::reset << rang::style::reset;
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  const bool is_error = diag.severity == Severity::Error;
  std::string header = is_error ? "error" : "warning";
  if (diag.code != DiagCode::None) {
    header += fmt::format("[{}]", to_string(diag.code));
  }
  write(header, is_error ? Tone::Error : Tone::Warning);
  write(fmt::format(": {}\n", diag.message));

  print_location(diag, sources);

  // Labels are shown top to bottom, whatever order they were attached in.
  std::vector<const Label *> labels;
  for (const auto & label : diag.labels) {
    labels.push_back(&label);
  }
  std::stable_sort(labels.begin(), labels.end(), [](const Label * a, const Label * b) {
    return a->range.start < b->range.start;
  });

  for (const Label * label : labels) {
    const SourceFile * file = sources.file(label->range.file);
    if (file != nullptr && label->range.is_valid()) {
      print_snippet(*file, *label);
    } else if (!label->message.empty()) {
      print_footer("note", label->message);
    }
  }

  if (diag.insertion) {
    print_insertion(*diag.insertion, sources);
  }
  if (diag.help) {
    print_footer("help", *diag.help);
  }

  write("\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  std::vector<const Diagnostic *> ordered;
  ordered.reserve(diags.size());
  for (const auto & d : diags) {
    ordered.push_back(&d);
  }

  // An invalid FileId is the largest value, so fileless diagnostics sort last.
  std::stable_sort(ordered.begin(), ordered.end(), [](const Diagnostic * a, const Diagnostic * b) {
    const SourceRange ra = a->range();
    const SourceRange rb = b->range();
    if (ra.file != rb.file) {
      return ra.file.value < rb.file.value;
    }
    return ra.start < rb.start;
  });

  for (const Diagnostic * d : ordered) {
    print(*d, sources);
  }
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags)
{
  const size_t n = diags.error_count();
  if (n == 0) {
    return;
  }
  write("error", Tone::Error);
  write(fmt::format(": {} error{} emitted\n", n, n == 1 ? "" : "s"));
}

void DiagnosticPrinter::print_location(const Diagnostic & diag, const SourceRegistry & sources)
{
  const SourceRange range = diag.range();
  const SourceFile * file = sources.file(range.file);
  if (file == nullptr) {
    return;
  }

  write("  --> ", Tone::Accent);
  const SourcePosition pos = sources.position_of(range);
  if (pos.is_valid()) {
    write(fmt::format("{}:{}:{}\n", display_path(file->path()), pos.line, pos.column));
  } else {
    write(display_path(file->path()) + "\n");
  }
  print_gutter(0);
  write("\n");
}

void DiagnosticPrinter::print_snippet(const SourceFile & file, const Label & label)
{
  const SourcePosition pos = file.position_of(label.range.start);
  const std::string_view line = file.line_text(pos.line);
  const uint32_t start = line_start(file, line);

  print_gutter(pos.line);
  write(line.empty() ? std::string("\n") : " " + expand_tabs(line) + "\n");

  // Underline up to the end of the line; ranges that start at end of input still get one marker.
  const uint32_t from = std::min(label.range.start - start, static_cast<uint32_t>(line.size()));
  const uint32_t to = std::min(label.range.end - start, static_cast<uint32_t>(line.size()));
  const size_t pad = display_width(line.substr(0, from));
  const size_t len =
    std::max<size_t>(1, to > from ? display_width(line.substr(from, to - from)) : 0);

  print_gutter(0);
  write(std::string(pad + 1, ' '));
  std::string marker(len, label.primary ? '^' : '-');
  if (!label.message.empty()) {
    marker += " " + label.message;
  }
  write(marker, label.primary ? Tone::Error : Tone::Accent);
  write("\n");
}

void DiagnosticPrinter::print_insertion(const Insertion & insertion, const SourceRegistry & sources)
{
  print_footer("help", fmt::format("insert '{}' here", insertion.text));

  const SourceFile * file = sources.file(insertion.at.file);
  if (file == nullptr || !insertion.at.is_valid()) {
    return;
  }

  // Preview the line with the text spliced in.
  const SourcePosition pos = file->position_of(insertion.at.start);
  const std::string_view line = file->line_text(pos.line);
  const uint32_t split =
    std::min(insertion.at.start - line_start(*file, line), static_cast<uint32_t>(line.size()));

  print_gutter(pos.line);
  write(" " + expand_tabs(line.substr(0, split)));
  write(insertion.text, Tone::Inserted);
  write(expand_tabs(line.substr(split)) + "\n");

  print_gutter(0);
  write(std::string(display_width(line.substr(0, split)) + 1, ' '));
  write(std::string(display_width(insertion.text), '+'), Tone::Inserted);
  write("\n");
}

void DiagnosticPrinter::print_footer(std::string_view kind, std::string_view message)
{
  print_gutter(0);
  write("\n");
  write("   = ", Tone::Accent);
  write(fmt::format("{}: {}\n", kind, message));
}

void DiagnosticPrinter::print_gutter(uint32_t line_number)
{
  if (line_number == 0) {
    write("      |", Tone::Accent);
  } else {
    write(fmt::format(" {:>4} |", line_number), Tone::Accent);
  }
}

}  // namespace sysml_lite
