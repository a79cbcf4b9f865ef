// sysml_lite/syntax/frontend.cpp - High-level parse pipeline
#include "sysml_lite/syntax/frontend.hpp"

#include <utility>

#include "sysml_lite/syntax/lexer.hpp"
#include "sysml_lite/syntax/parser.hpp"

namespace sysml_lite
{

ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags)
{
  ParseOutput out;
  out.file_id = sources.add(path, std::move(source_text));

  const SourceFile * file = sources.file(out.file_id);
  if (file == nullptr) {
    diags.error(SourceRange{}, "too many source files: " + path.string())
      .code(DiagCode::FileUnreadable);
    out.model = ast.create<Model>();
    return out;
  }

  syntax::Lexer lexer(out.file_id, file->text());
  syntax::Parser parser(ast, diags, lexer.lex_all());
  out.model = parser.parse();
  return out;
}

}  // namespace sysml_lite
