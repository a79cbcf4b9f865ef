#include "sysml_lite/ast/ast_dumper.hpp"

#include <sstream>
#include <utility>
#include <variant>

#include "sysml_lite/ast/properties.hpp"

namespace sysml_lite
{
namespace
{

void write_property(std::ostream & os, const Property & prop)
{
  os << ' ' << prop.key << '=';
  if (const auto * d = std::get_if<double>(&prop.value)) {
    os << format_number(*d);
  } else if (prop.key == prop_key::k_default_value) {
    os << '"' << std::get<std::string_view>(prop.value) << '"';
  } else {
    os << '\'' << std::get<std::string_view>(prop.value) << '\'';
  }
}

}  // namespace

void AstDumper::visit_model(const Model * model)
{
  os_ << class_name(model->get_kind()) << '\n';
  dump_children(model->elements);
}

void AstDumper::visit_element(const Element * element)
{
  os_ << indent_ << (last_ ? "`-" : "|-") << class_name(element->get_kind());
  for (const Property & prop : properties(element)) {
    write_property(os_, prop);
  }
  os_ << '\n';

  if (element->children.empty()) {
    return;
  }
  const std::string saved = indent_;
  indent_ += last_ ? "  " : "| ";
  dump_children(element->children);
  indent_ = saved;
}

void AstDumper::dump_children(gsl::span<Element * const> children)
{
  for (size_t i = 0; i < children.size(); ++i) {
    last_ = i + 1 == children.size();
    visit(children[i]);
  }
}

void dump(const AstNode * node, std::ostream & os)
{
  AstDumper dumper(os);
  dumper.dump(node);
}

std::string dump_to_string(const AstNode * node)
{
  std::ostringstream ss;
  dump(node, ss);
  return ss.str();
}

}  // namespace sysml_lite
