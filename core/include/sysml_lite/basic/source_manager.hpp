// sysml_lite/basic/source_manager.hpp - Source text, byte ranges and positions
//
// Tokens, AST nodes and diagnostics refer to model text through a FileId and
// a half-open byte range. Line/column positions are only computed when a
// diagnostic is rendered.
//
#pragma once

#include <algorithm>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace sysml_lite
{

/// Index of a file in a SourceRegistry.
struct FileId
{
  uint16_t value = UINT16_MAX;

  [[nodiscard]] static constexpr FileId invalid() noexcept { return FileId{}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != UINT16_MAX; }

  friend constexpr bool operator==(FileId a, FileId b) noexcept { return a.value == b.value; }
  friend constexpr bool operator!=(FileId a, FileId b) noexcept { return a.value != b.value; }
};

/// Byte range [start, end) in one file. Default-constructed ranges point nowhere.
struct SourceRange
{
  static constexpr uint32_t k_no_offset = UINT32_MAX;

  FileId file;
  uint32_t start = k_no_offset;
  uint32_t end = k_no_offset;

  [[nodiscard]] static constexpr SourceRange empty_at(FileId id, uint32_t offset) noexcept
  {
    return {id, offset, offset};
  }

  /// Range from the start of `first` to the furthest end of the two.
  [[nodiscard]] static constexpr SourceRange cover(SourceRange first, SourceRange last) noexcept
  {
    return {first.file, first.start, std::max(first.end, last.end)};
  }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return file.is_valid() && start != k_no_offset && end != k_no_offset;
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    return (is_valid() && end > start) ? end - start : 0;
  }

  friend constexpr bool operator==(SourceRange a, SourceRange b) noexcept
  {
    return a.file == b.file && a.start == b.start && a.end == b.end;
  }
  friend constexpr bool operator!=(SourceRange a, SourceRange b) noexcept { return !(a == b); }
};

/// 1-based line and column. Columns count characters, the same way the lexer does.
struct SourcePosition
{
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0; }
};

/**
 * Text of one model file plus the byte offset of every line start.
 */
class SourceFile
{
public:
  SourceFile(std::filesystem::path path, std::string text);

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view text() const noexcept { return text_; }
  [[nodiscard]] size_t size() const noexcept { return text_.size(); }
  [[nodiscard]] size_t line_count() const noexcept { return line_starts_.size(); }

  /// Offsets past the end are clamped to the end of the text.
  [[nodiscard]] SourcePosition position_of(uint32_t offset) const noexcept;

  /// Line `line` (1-based) without its terminator; empty when out of range.
  [[nodiscard]] std::string_view line_text(uint32_t line) const noexcept;

  [[nodiscard]] std::string_view slice(SourceRange range) const noexcept;

private:
  std::filesystem::path path_;
  std::string text_;
  std::vector<uint32_t> line_starts_;
};

/**
 * Owns the text of every file read during one run.
 *
 * Each call to add() gets a fresh FileId; the registry never looks files up
 * by path. Once the FileId space is used up add() returns FileId::invalid().
 */
class SourceRegistry
{
public:
  SourceRegistry() = default;

  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;
  SourceRegistry(SourceRegistry &&) = default;
  SourceRegistry & operator=(SourceRegistry &&) = default;

  [[nodiscard]] FileId add(std::filesystem::path path, std::string text);

  [[nodiscard]] const SourceFile * file(FileId id) const noexcept;
  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

  /// Position of the start of `range`; invalid when the file is unknown.
  [[nodiscard]] SourcePosition position_of(SourceRange range) const noexcept;
  [[nodiscard]] std::string_view slice(SourceRange range) const noexcept;

private:
  std::deque<SourceFile> files_;
};

}  // namespace sysml_lite
