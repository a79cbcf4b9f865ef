// sysml_lite/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "sysml_lite/ast/ast.hpp"
#include "sysml_lite/ast/ast_context.hpp"
#include "sysml_lite/basic/diagnostic.hpp"
#include "sysml_lite/basic/source_manager.hpp"

namespace sysml_lite
{

struct ParseOutput
{
  FileId file_id = FileId::invalid();
  Model * model = nullptr;
};

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
//
// The text is registered under `path` first, so token ranges and diagnostics
// refer to that file. `model` is never null; after a parse failure it holds
// the elements completed before the failure.
[[nodiscard]] ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags);

}  // namespace sysml_lite
