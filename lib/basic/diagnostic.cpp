// wirebind/basic/diagnostic.cpp - Diagnostic implementation
#include "wirebind/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace wirebind
{

std::string_view diagnostic_code(DiagnosticKind kind) noexcept
{
  switch (kind) {
    case DiagnosticKind::SchemaError:
      return "E0001";
    case DiagnosticKind::IoError:
      return "E0002";
    case DiagnosticKind::ConflictingAnnotation:
      return "E0101";
    case DiagnosticKind::MalformedDirectiveValue:
      return "E0102";
    case DiagnosticKind::AmbiguousOptionality:
      return "E0103";
    case DiagnosticKind::StrategyPreconditionViolation:
      return "E0104";
    case DiagnosticKind::UnmatchedVariant:
      return "E0105";
    case DiagnosticKind::EmptyCustomFunctionReference:
      return "E0106";
    case DiagnosticKind::ConflictingErrorType:
      return "E0107";
    case DiagnosticKind::MissingErrorFunction:
      return "E0108";
    case DiagnosticKind::InferredOptionality:
      return "W0101";
    case DiagnosticKind::UnknownDirective:
      return "W0102";
  }
  return "E0000";
}

std::string_view diagnostic_kind_name(DiagnosticKind kind) noexcept
{
  switch (kind) {
    case DiagnosticKind::SchemaError:
      return "SchemaError";
    case DiagnosticKind::IoError:
      return "IoError";
    case DiagnosticKind::ConflictingAnnotation:
      return "ConflictingAnnotation";
    case DiagnosticKind::MalformedDirectiveValue:
      return "MalformedDirectiveValue";
    case DiagnosticKind::AmbiguousOptionality:
      return "AmbiguousOptionality";
    case DiagnosticKind::StrategyPreconditionViolation:
      return "StrategyPreconditionViolation";
    case DiagnosticKind::UnmatchedVariant:
      return "UnmatchedVariant";
    case DiagnosticKind::EmptyCustomFunctionReference:
      return "EmptyCustomFunctionReference";
    case DiagnosticKind::ConflictingErrorType:
      return "ConflictingErrorType";
    case DiagnosticKind::MissingErrorFunction:
      return "MissingErrorFunction";
    case DiagnosticKind::InferredOptionality:
      return "InferredOptionality";
    case DiagnosticKind::UnknownDirective:
      return "UnknownDirective";
  }
  return "Unknown";
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

DiagnosticBuilder & DiagnosticBuilder::in_aggregate(std::string name)
{
  diagnostic_.aggregate = std::move(name);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::on_field(std::string name)
{
  diagnostic_.field = std::move(name);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::at(SourceLocation location)
{
  diagnostic_.location = std::move(location);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_note(std::string note)
{
  diagnostic_.notes.push_back(std::move(note));
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

namespace
{

Diagnostic make_diagnostic(Severity severity, DiagnosticKind kind, std::string message)
{
  Diagnostic d;
  d.severity = severity;
  d.kind = kind;
  d.message = std::move(message);
  return d;
}

}  // namespace

DiagnosticBuilder DiagnosticBag::report_error(DiagnosticKind kind, std::string message)
{
  return {*this, make_diagnostic(Severity::Error, kind, std::move(message))};
}

DiagnosticBuilder DiagnosticBag::report_warning(DiagnosticKind kind, std::string message)
{
  return {*this, make_diagnostic(Severity::Warning, kind, std::move(message))};
}

DiagnosticBuilder DiagnosticBag::report_info(DiagnosticKind kind, std::string message)
{
  return {*this, make_diagnostic(Severity::Info, kind, std::move(message))};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  std::vector<Diagnostic> out;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(out),
    [](const Diagnostic & d) { return d.severity == Severity::Error; });
  return out;
}

std::vector<Diagnostic> DiagnosticBag::warnings() const
{
  std::vector<Diagnostic> out;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(out),
    [](const Diagnostic & d) { return d.severity == Severity::Warning; });
  return out;
}

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

bool DiagnosticBag::has_warnings() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Warning;
  });
}

size_t DiagnosticBag::error_count() const
{
  return static_cast<size_t>(
    std::count_if(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
      return d.severity == Severity::Error;
    }));
}

bool DiagnosticBag::contains(DiagnosticKind kind) const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [kind](const Diagnostic & d) {
    return d.kind == kind;
  });
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

}  // namespace wirebind
