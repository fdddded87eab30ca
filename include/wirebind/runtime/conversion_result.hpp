// wirebind/runtime/conversion_result.hpp - Result of a fallible generated conversion
//
// Included by generated headers. Header only.
//
#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace wirebind::runtime
{

/**
 * Either a converted value or the error that stopped the conversion.
 */
template <typename T, typename E>
class ConversionResult
{
public:
  /// Create a successful result
  static ConversionResult ok(T value)
  {
    return ConversionResult(std::in_place_index<0>, std::move(value));
  }

  /// Create a failed result
  static ConversionResult fail(E error)
  {
    return ConversionResult(std::in_place_index<1>, std::move(error));
  }

  [[nodiscard]] bool success() const noexcept { return state_.index() == 0; }
  explicit operator bool() const noexcept { return success(); }

  /// Converted value; only valid if success() is true
  [[nodiscard]] const T & value() const & { return std::get<0>(state_); }
  [[nodiscard]] T && value() && { return std::get<0>(std::move(state_)); }

  /// Error; only valid if success() is false
  [[nodiscard]] const E & error() const & { return std::get<1>(state_); }

private:
  template <std::size_t I, typename V>
  ConversionResult(std::in_place_index_t<I> tag, V && v) : state_(tag, std::forward<V>(v))
  {
  }

  std::variant<T, E> state_;
};

/**
 * Thrown when a fallible conversion is used where a value is required,
 * e.g. a nested aggregate converted through from_wire().
 */
template <typename E>
class ConversionFailure : public std::runtime_error
{
public:
  ConversionFailure(const std::string & aggregate, E error)
  : std::runtime_error("conversion of '" + aggregate + "' failed"), error_(std::move(error))
  {
  }

  [[nodiscard]] const E & error() const noexcept { return error_; }

private:
  E error_;
};

/**
 * Value of a result, or ConversionFailure<E> if it holds an error.
 */
template <typename T, typename E>
T value_or_throw(ConversionResult<T, E> && result, const char * aggregate)
{
  if (!result.success()) {
    throw ConversionFailure<E>(aggregate, result.error());
  }
  return std::move(result).value();
}

}  // namespace wirebind::runtime
