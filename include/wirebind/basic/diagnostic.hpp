// wirebind/basic/diagnostic.hpp - Diagnostic types for schema analysis and codegen
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wirebind/basic/source_location.hpp"

namespace wirebind
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

/**
 * Failure taxonomy of the generation pass.
 *
 * Every error kind is terminal for the aggregate it was reported against.
 */
enum class DiagnosticKind : uint8_t {
  SchemaError,
  ConflictingAnnotation,
  MalformedDirectiveValue,
  AmbiguousOptionality,
  StrategyPreconditionViolation,
  UnmatchedVariant,
  EmptyCustomFunctionReference,
  ConflictingErrorType,
  MissingErrorFunction,
  InferredOptionality,
  UnknownDirective,
  IoError,
};

/// Stable code printed in brackets, e.g. "E0103".
[[nodiscard]] std::string_view diagnostic_code(DiagnosticKind kind) noexcept;

/// Human readable kind name, e.g. "AmbiguousOptionality".
[[nodiscard]] std::string_view diagnostic_kind_name(DiagnosticKind kind) noexcept;

struct Diagnostic
{
  Severity severity = Severity::Error;
  DiagnosticKind kind = DiagnosticKind::SchemaError;
  std::string message;

  std::string aggregate;  // enclosing aggregate or enumeration, may be empty
  std::string field;      // field or variant, may be empty
  SourceLocation location;

  std::vector<std::string> notes;
  std::optional<std::string> help_message;  // suggested fix

  [[nodiscard]] std::string_view code() const noexcept { return diagnostic_code(kind); }
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder; the diagnostic is committed to the bag on destruction (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & in_aggregate(std::string name);

  DiagnosticBuilder & on_field(std::string name);

  DiagnosticBuilder & at(SourceLocation location);

  DiagnosticBuilder & with_note(std::string note);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report_error(DiagnosticKind kind, std::string message);
  DiagnosticBuilder report_warning(DiagnosticKind kind, std::string message);
  DiagnosticBuilder report_info(DiagnosticKind kind, std::string message);

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;
  [[nodiscard]] size_t error_count() const;

  /// True if a diagnostic of the given kind has been reported.
  [[nodiscard]] bool contains(DiagnosticKind kind) const;

  // Utilities
  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace wirebind
