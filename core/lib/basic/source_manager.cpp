// sysml_lite/basic/source_manager.cpp
#include "sysml_lite/basic/source_manager.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace sysml_lite
{
namespace
{

bool is_continuation_byte(char c) { return (static_cast<unsigned char>(c) & 0xC0) == 0x80; }

}  // namespace

SourceFile::SourceFile(std::filesystem::path path, std::string text)
: path_(std::move(path)), text_(std::move(text))
{
  line_starts_.push_back(0);
  for (uint32_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n') {
      line_starts_.push_back(i + 1);
    }
  }
}

SourcePosition SourceFile::position_of(uint32_t offset) const noexcept
{
  offset = std::min(offset, static_cast<uint32_t>(text_.size()));

  // Last line start not after `offset`.
  const auto next = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  const auto line_index = static_cast<uint32_t>(std::distance(line_starts_.begin(), next) - 1);

  uint32_t column = 1;
  for (uint32_t i = line_starts_[line_index]; i < offset; ++i) {
    if (!is_continuation_byte(text_[i])) {
      ++column;
    }
  }
  return {line_index + 1, column};
}

std::string_view SourceFile::line_text(uint32_t line) const noexcept
{
  if (line == 0 || line > line_starts_.size()) {
    return {};
  }
  const uint32_t begin = line_starts_[line - 1];
  uint32_t end =
    (line < line_starts_.size()) ? line_starts_[line] : static_cast<uint32_t>(text_.size());
  while (end > begin && (text_[end - 1] == '\n' || text_[end - 1] == '\r')) {
    --end;
  }
  return std::string_view(text_).substr(begin, end - begin);
}

std::string_view SourceFile::slice(SourceRange range) const noexcept
{
  if (!range.is_valid() || range.start >= text_.size()) {
    return {};
  }
  const uint32_t end = std::min(range.end, static_cast<uint32_t>(text_.size()));
  if (end <= range.start) {
    return {};
  }
  return std::string_view(text_).substr(range.start, end - range.start);
}

FileId SourceRegistry::add(std::filesystem::path path, std::string text)
{
  if (files_.size() >= static_cast<size_t>(FileId::invalid().value)) {
    return FileId::invalid();
  }
  const FileId id{static_cast<uint16_t>(files_.size())};
  files_.emplace_back(std::move(path), std::move(text));
  return id;
}

const SourceFile * SourceRegistry::file(FileId id) const noexcept
{
  if (!id.is_valid() || id.value >= files_.size()) {
    return nullptr;
  }
  return &files_[id.value];
}

SourcePosition SourceRegistry::position_of(SourceRange range) const noexcept
{
  const SourceFile * f = file(range.file);
  if (f == nullptr || !range.is_valid()) {
    return {};
  }
  return f->position_of(range.start);
}

std::string_view SourceRegistry::slice(SourceRange range) const noexcept
{
  const SourceFile * f = file(range.file);
  return f ? f->slice(range) : std::string_view{};
}

}  // namespace sysml_lite
