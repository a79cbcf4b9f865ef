// sysml_lite/basic/diagnostic.cpp
#include "sysml_lite/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace sysml_lite
{
namespace
{

Diagnostic make(Severity severity, SourceRange range, std::string message, std::string label)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.labels.push_back(Label{range, std::move(label), true});
  return d;
}

}  // namespace

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diag_(std::move(other.diag_))
{
  other.bag_ = nullptr;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (bag_ != nullptr) {
    bag_->add(std::move(diag_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::code(DiagCode c)
{
  diag_.code = c;
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::note_at(SourceRange range, std::string message)
{
  diag_.labels.push_back(Label{range, std::move(message), false});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::insert(SourceRange at, std::string text)
{
  diag_.insertion = Insertion{at, std::move(text)};
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::help(std::string message)
{
  diag_.help = std::move(message);
  return *this;
}

DiagnosticBuilder DiagnosticBag::error(SourceRange range, std::string message, std::string label)
{
  return {*this, make(Severity::Error, range, std::move(message), std::move(label))};
}

DiagnosticBuilder DiagnosticBag::warning(SourceRange range, std::string message, std::string label)
{
  return {*this, make(Severity::Warning, range, std::move(message), std::move(label))};
}

void DiagnosticBag::append(DiagnosticBag && other)
{
  std::move(other.items_.begin(), other.items_.end(), std::back_inserter(items_));
  other.items_.clear();
}

size_t DiagnosticBag::error_count() const noexcept
{
  return static_cast<size_t>(std::count_if(items_.begin(), items_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  }));
}

}  // namespace sysml_lite
