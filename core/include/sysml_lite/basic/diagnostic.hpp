// sysml_lite/basic/diagnostic.hpp - Parse and driver diagnostics
//
// The parser reports at most one structural error per file; the driver adds
// file, configuration and output errors that carry no source range.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sysml_lite/basic/source_manager.hpp"

namespace sysml_lite
{

enum class Severity : uint8_t {
  Error,
  Warning,
};

/// Stable diagnostic codes, printed as `E0001` and so on.
enum class DiagCode : uint8_t {
  None,
  UnexpectedToken,  ///< expect() saw the wrong token
  StrayCloseBrace,  ///< `}` with no open body at top level
  FileNotFound,
  FileUnreadable,
  ConfigError,
  OutputError,
};

[[nodiscard]] constexpr std::string_view to_string(DiagCode code) noexcept
{
  switch (code) {
    case DiagCode::None:
      return "";
    case DiagCode::UnexpectedToken:
      return "E0001";
    case DiagCode::StrayCloseBrace:
      return "E0002";
    case DiagCode::FileNotFound:
      return "E0100";
    case DiagCode::FileUnreadable:
      return "E0101";
    case DiagCode::ConfigError:
      return "E0102";
    case DiagCode::OutputError:
      return "E0103";
  }
  return "";
}

struct Label
{
  SourceRange range;
  std::string message;
  bool primary = true;
};

/// Text to insert at a location, e.g. the `}` that closes an unfinished body.
struct Insertion
{
  SourceRange at;
  std::string text;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  DiagCode code = DiagCode::None;
  std::string message;

  /// The first label is the primary location.
  std::vector<Label> labels;
  std::optional<Insertion> insertion;
  std::optional<std::string> help;

  [[nodiscard]] SourceRange range() const noexcept
  {
    return labels.empty() ? SourceRange{} : labels.front().range;
  }
};

class DiagnosticBag;

/**
 * Fills in one diagnostic and hands it to its bag when destroyed.
 *
 * @code
 *   diags.error(range, "expected ...", "unexpected token").code(DiagCode::UnexpectedToken);
 * @endcode
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag) : bag_(&bag), diag_(std::move(diag)) {}

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;
  DiagnosticBuilder & operator=(DiagnosticBuilder &&) = delete;

  ~DiagnosticBuilder();

  DiagnosticBuilder & code(DiagCode c);
  DiagnosticBuilder & note_at(SourceRange range, std::string message);
  DiagnosticBuilder & insert(SourceRange at, std::string text);
  DiagnosticBuilder & help(std::string message);

private:
  DiagnosticBag * bag_;
  Diagnostic diag_;
};

class DiagnosticBag
{
public:
  /// `label` annotates `range` in the rendered source snippet.
  DiagnosticBuilder error(SourceRange range, std::string message, std::string label = {});
  DiagnosticBuilder warning(SourceRange range, std::string message, std::string label = {});

  void add(Diagnostic diag) { items_.push_back(std::move(diag)); }
  void append(DiagnosticBag && other);

  [[nodiscard]] const std::vector<Diagnostic> & items() const noexcept { return items_; }
  [[nodiscard]] bool empty() const noexcept { return items_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return items_.size(); }

  [[nodiscard]] size_t error_count() const noexcept;
  [[nodiscard]] size_t warning_count() const noexcept { return items_.size() - error_count(); }
  [[nodiscard]] bool has_errors() const noexcept { return error_count() > 0; }

  [[nodiscard]] auto begin() const noexcept { return items_.begin(); }
  [[nodiscard]] auto end() const noexcept { return items_.end(); }

private:
  std::vector<Diagnostic> items_;
};

}  // namespace sysml_lite
