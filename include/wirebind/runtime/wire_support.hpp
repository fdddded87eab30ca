// wirebind/runtime/wire_support.hpp - Helpers called from generated conversions
//
// Included by generated headers. Header only; needs the protobuf headers.
//
#pragma once

#include <google/protobuf/repeated_field.h>
#include <google/protobuf/repeated_ptr_field.h>

#include <stdexcept>
#include <string>
#include <utility>

#include "wirebind/runtime/conversion_result.hpp"

namespace wirebind::runtime
{

// ============================================================================
// Panics
// ============================================================================

/**
 * A required domain value was absent on the wire.
 */
class MissingFieldPanic : public std::runtime_error
{
public:
  MissingFieldPanic(std::string aggregate, std::string field)
  : std::runtime_error("missing wire field '" + field + "' while converting '" + aggregate + "'"),
    aggregate_(std::move(aggregate)),
    field_(std::move(field))
  {
  }

  [[nodiscard]] const std::string & aggregate() const noexcept { return aggregate_; }
  [[nodiscard]] const std::string & field() const noexcept { return field_; }

private:
  std::string aggregate_;
  std::string field_;
};

/**
 * An enum value has no counterpart on the other side.
 */
class UnknownEnumValue : public std::runtime_error
{
public:
  UnknownEnumValue(const std::string & enum_name, int value)
  : std::runtime_error("value " + std::to_string(value) + " has no counterpart in '" + enum_name + "'"),
    value_(value)
  {
  }

  [[nodiscard]] int value() const noexcept { return value_; }

private:
  int value_;
};

[[noreturn]] inline void missing_field_panic(const char * aggregate, const char * field)
{
  throw MissingFieldPanic(aggregate, field);
}

[[noreturn]] inline void unknown_enum_value_panic(const char * enum_name, int value)
{
  throw UnknownEnumValue(enum_name, value);
}

// ============================================================================
// Repeated field emission
// ============================================================================

/// Append to a repeated scalar or enum field.
template <typename T, typename V>
void append(google::protobuf::RepeatedField<T> & field, V && value)
{
  field.Add(static_cast<T>(std::forward<V>(value)));
}

/// Append to a repeated string or message field.
template <typename T, typename V>
void append(google::protobuf::RepeatedPtrField<T> & field, V && value)
{
  *field.Add() = std::forward<V>(value);
}

}  // namespace wirebind::runtime
