// sysml_lite/test_support/parse_helpers.hpp - helpers for unit tests
//
// A lightweight single-file parsing pipeline for tests. Ownership stays
// explicit (SourceRegistry + AstContext) behind one convenient wrapper.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>

#include "sysml_lite/ast/ast_context.hpp"
#include "sysml_lite/basic/diagnostic.hpp"
#include "sysml_lite/basic/source_manager.hpp"
#include "sysml_lite/syntax/frontend.hpp"

namespace sysml_lite::test_support
{

struct TestParseUnit
{
  SourceRegistry sources;
  FileId file_id = FileId::invalid();
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  Model * model = nullptr;

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept { return sources.slice(r); }

  [[nodiscard]] SourcePosition position_of(SourceRange r) const noexcept
  {
    return sources.position_of(r);
  }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, const std::filesystem::path & virtual_path = "<test>.sysml")
{
  TestParseUnit out;
  out.ast = std::make_unique<AstContext>();

  const ParseOutput parsed =
    parse_source(out.sources, virtual_path, std::move(src), *out.ast, out.diags);
  out.file_id = parsed.file_id;
  out.model = parsed.model;
  return out;
}

}  // namespace sysml_lite::test_support
