// wirebind/analysis/directive.hpp - Typed field and aggregate directives
//
// Raw directive tokens from the schema are parsed exactly once into the
// records below; everything downstream works on these records.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <gsl/span>

#include "wirebind/basic/diagnostic.hpp"
#include "wirebind/schema/schema_document.hpp"

namespace wirebind
{

// ============================================================================
// Directive Records
// ============================================================================

enum class ExpectMode : uint8_t {
  None,
  Panic,
  Error,
};

enum class Optionality : uint8_t {
  Optional,
  Required,
};

[[nodiscard]] std::string_view to_string(ExpectMode mode) noexcept;
[[nodiscard]] std::string_view to_string(Optionality optionality) noexcept;

/**
 * Value of a `default` directive.
 *
 * Without a function the domain type is value-initialised.
 */
struct DefaultValue
{
  std::optional<std::string> function;

  friend bool operator==(const DefaultValue & a, const DefaultValue & b)
  {
    return a.function == b.function;
  }
};

/**
 * Directives of an aggregate or enumeration.
 */
struct AggregateAnnotation
{
  /// Namespace of the generated functions, overriding the schema namespace
  std::optional<std::string> namespace_override;

  /// Name of the wire message or enum when it differs from the domain name
  std::optional<std::string> wire_name;

  /// Inherited by fields that do not set their own
  std::optional<std::string> error_type;
  std::optional<std::string> error_fn;
};

/**
 * Directives of one field, with aggregate-level error settings merged in.
 */
struct FieldAnnotation
{
  bool ignore = false;
  bool transparent = false;
  bool wire_scalar = false;
  ExpectMode expect_mode = ExpectMode::None;
  std::optional<DefaultValue> default_value;
  std::optional<std::string> rename;
  std::optional<Optionality> explicit_optionality;
  std::optional<std::string> custom_from_wire_fn;
  std::optional<std::string> custom_to_wire_fn;
  std::optional<std::string> error_fn;
  std::optional<std::string> error_type;

  [[nodiscard]] bool has_custom_fn() const noexcept
  {
    return custom_from_wire_fn.has_value() || custom_to_wire_fn.has_value();
  }

  /// Absence-handling directives are present (expect or default).
  [[nodiscard]] bool has_usage_indicators() const noexcept
  {
    return expect_mode != ExpectMode::None || default_value.has_value();
  }
};

// ============================================================================
// Directive Parser
// ============================================================================

/**
 * Parses raw directive tokens.
 *
 * A token is `name`, `name(arg)` or `name = value`; one token may hold several
 * directives separated by commas. Values are either a quoted literal or a
 * (possibly qualified) identifier.
 *
 * Errors are reported to the bag and the parse returns std::nullopt. Unknown
 * directives are warnings and do not fail the parse.
 */
class DirectiveParser
{
public:
  explicit DirectiveParser(DiagnosticBag * diags);

  /**
   * Parse the directives of an aggregate or enumeration.
   *
   * @param tokens Raw tokens
   * @param owner Aggregate or enum name (diagnostic context)
   * @param location Position of the declaration
   */
  [[nodiscard]] std::optional<AggregateAnnotation> parse_aggregate(
    gsl::span<const std::string> tokens, const std::string & owner,
    const SourceLocation & location);

  /**
   * Parse the directives of a field.
   *
   * Error type and error function fall back to the aggregate values.
   */
  [[nodiscard]] std::optional<FieldAnnotation> parse_field(
    const FieldDescriptor & field, const AggregateAnnotation & inherited);

private:
  DiagnosticBag * diags_;
};

}  // namespace wirebind
