// ripple/basic/diagnostic.cpp - Diagnostic collection
#include "ripple/basic/diagnostic.hpp"

#include <algorithm>

namespace ripple
{

const Label * Diagnostic::primary_label() const noexcept
{
  const auto it = std::find_if(labels.begin(), labels.end(), [](const Label & l) {
    return l.style == LabelStyle::Primary;
  });
  if (it != labels.end()) {
    return &*it;
  }
  return labels.empty() ? nullptr : &labels.front();
}

SourceRange Diagnostic::primary_range() const noexcept
{
  const Label * label = primary_label();
  return label != nullptr ? label->range : SourceRange{};
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(SourceRange range, std::string msg)
{
  diagnostic_.labels.push_back(Label{range, std::move(msg), LabelStyle::Secondary});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report(
  Severity severity, SourceRange range, std::string message, std::string label_message)
{
  Diagnostic diag;
  diag.severity = severity;
  diag.message = std::move(message);
  diag.labels.push_back(Label{range, std::move(label_message), LabelStyle::Primary});
  return {*this, std::move(diag)};
}

DiagnosticBuilder DiagnosticBag::report_error(
  SourceRange range, std::string message, std::string label_message)
{
  return report(Severity::Error, range, std::move(message), std::move(label_message));
}

DiagnosticBuilder DiagnosticBag::report_warning(
  SourceRange range, std::string message, std::string label_message)
{
  return report(Severity::Warning, range, std::move(message), std::move(label_message));
}

DiagnosticBuilder DiagnosticBag::report_info(
  SourceRange range, std::string message, std::string label_message)
{
  return report(Severity::Info, range, std::move(message), std::move(label_message));
}

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  std::vector<Diagnostic> out;
  for (const auto & d : diagnostics_) {
    if (d.severity == Severity::Error) {
      out.push_back(d);
    }
  }
  return out;
}

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

bool DiagnosticBag::has_code(std::string_view code) const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [code](const Diagnostic & d) {
    return d.code == code;
  });
}

}  // namespace ripple
