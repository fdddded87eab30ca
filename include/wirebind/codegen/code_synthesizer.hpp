// wirebind/codegen/code_synthesizer.hpp - Per-field conversion statement templates
//
// Turns a resolved strategy into the C++ statements of the wire->domain and
// domain->wire conversion functions. Generated code reads the protoc API:
//   wire.f(), wire.has_f(), wire.set_f(v), *wire.mutable_f() = v
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "wirebind/strategy/conversion_strategy.hpp"

namespace wirebind
{

enum class Direction : uint8_t {
  WireToDomain,
  DomainToWire,
};

/**
 * Conversion of one value (or one sequence element) in both directions,
 * expressed as text wrapped around the source expression.
 */
class ValueConversion
{
public:
  /// No conversion: the value is used as is.
  [[nodiscard]] static ValueConversion identity();

  /**
   * from_wire(x) / to_wire(x): nested aggregates and enums.
   *
   * @param qualifier Namespace prefix such as "::other::" when the overloads
   *                  live outside the namespace being generated
   */
  [[nodiscard]] static ValueConversion overloaded_call(const std::string & qualifier = {});

  /**
   * Transparent wrapper `Type{inner(x)}` / `inner((x).member)`.
   */
  [[nodiscard]] static ValueConversion transparent(
    const std::string & domain_type, const std::string & member, const ValueConversion & inner);

  /**
   * Cast the wire expression before converting, e.g. the int elements of a
   * repeated enum field.
   */
  [[nodiscard]] ValueConversion with_wire_cast(const std::string & wire_type) const;

  [[nodiscard]] std::string from_wire(std::string_view expr) const;
  [[nodiscard]] std::string to_wire(std::string_view expr) const;

  [[nodiscard]] bool is_identity() const noexcept;

private:
  std::string from_prefix_;
  std::string from_suffix_;
  std::string to_prefix_;
  std::string to_suffix_;
};

/**
 * Names and facts the templates need about one field.
 */
struct FieldIdentifiers
{
  /// Domain aggregate name, used in panic messages
  std::string aggregate;

  /// Domain member name
  std::string field;

  /// protoc accessor base name (lowercase, keyword-escaped)
  std::string wire_accessor;

  /// Full declared domain type, e.g. "std::optional<std::string>"
  std::string domain_type;

  bool domain_nullable = false;
  bool wire_optional = false;
  bool wire_repeated = false;

  /// Written through mutable_x() instead of set_x()
  bool wire_message_like = false;

  /// Value conversion; for collections, the per-element conversion
  ValueConversion value = ValueConversion::identity();

  /// Expression producing the error of Error-moded fields
  std::string error_expression;

  /// Result type of the enclosing fallible conversion
  std::string result_type;

  /// Indentation of the emitted statements
  std::string indent = "  ";
};

/**
 * Emits the statements of one field for one direction.
 *
 * Pure: identical inputs give byte-identical text. Directions a strategy
 * has nothing to do for yield an empty string (Ignore never writes to the
 * wire).
 */
class CodeSynthesizer
{
public:
  [[nodiscard]] static std::string synthesize(
    const ConversionStrategy & strategy, Direction direction, const FieldIdentifiers & ids);

private:
  static std::string wire_to_domain(const ConversionStrategy & strategy, const FieldIdentifiers & ids);
  static std::string domain_to_wire(const ConversionStrategy & strategy, const FieldIdentifiers & ids);
};

/**
 * Accessor base name protoc generates for a field: lowercased, with a
 * trailing underscore when it collides with a C++ keyword.
 */
[[nodiscard]] std::string wire_accessor_name(std::string_view wire_field_name);

}  // namespace wirebind
