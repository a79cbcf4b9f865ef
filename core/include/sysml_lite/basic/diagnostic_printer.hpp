// sysml_lite/basic/diagnostic_printer.hpp - Terminal rendering of diagnostics
#pragma once

#include <cstdint>
#include <iosfwd>
#include <string_view>

#include "sysml_lite/basic/diagnostic.hpp"
#include "sysml_lite/basic/source_manager.hpp"

namespace sysml_lite
{

/**
 * Renders diagnostics with the offending source lines underneath.
 *
 * @code
 *   error[E0001]: expected punctuation '}' but got EOF
 *     --> model/vehicle.sysml:3:1
 *         |
 *       1 | package Vehicle {
 *         |                 - body opened here
 *       3 |
 *         | ^ input ends here
 *         |
 *      = help: insert '}' here
 *       3 | }
 *         | +
 * @endcode
 *
 * Diagnostics without a source range (missing files, bad configuration)
 * print only their header line.
 */
class DiagnosticPrinter
{
public:
  /// Colors go through rang; pass false for plain output (files, tests).
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Print every diagnostic ordered by file and offset; fileless ones come last.
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

  /// `error: N errors emitted`, or nothing when there are no errors.
  void print_summary(const DiagnosticBag & diags);

private:
  enum class Tone : uint8_t { Plain, Error, Warning, Accent, Inserted };

  void write(std::string_view text, Tone tone = Tone::Plain);

  void print_location(const Diagnostic & diag, const SourceRegistry & sources);
  void print_snippet(const SourceFile & file, const Label & label);
  void print_insertion(const Insertion & insertion, const SourceRegistry & sources);
  void print_footer(std::string_view kind, std::string_view message);

  /// ` NNNN |` with a line number, `      |` without one.
  void print_gutter(uint32_t line_number);

  std::ostream & os_;
  bool use_color_;
};

}  // namespace sysml_lite
