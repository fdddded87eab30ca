// wirebind/strategy/conversion_strategy.hpp - Conversion strategy taxonomy
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wirebind
{

// ============================================================================
// ErrorMode
// ============================================================================

/**
 * Runtime behaviour of generated code when a wire value is missing.
 */
class ErrorMode
{
public:
  enum class Kind : uint8_t {
    None,
    Panic,
    Error,
    Default,
  };

  [[nodiscard]] static ErrorMode none() noexcept { return ErrorMode(Kind::None); }
  [[nodiscard]] static ErrorMode panic() noexcept { return ErrorMode(Kind::Panic); }
  [[nodiscard]] static ErrorMode error() noexcept { return ErrorMode(Kind::Error); }
  [[nodiscard]] static ErrorMode with_default(std::optional<std::string> function)
  {
    ErrorMode m(Kind::Default);
    m.default_fn_ = std::move(function);
    return m;
  }

  [[nodiscard]] Kind kind() const noexcept { return kind_; }

  /// Function producing the default value; nullopt means value-initialisation.
  [[nodiscard]] const std::optional<std::string> & default_fn() const noexcept
  {
    return default_fn_;
  }

  /// e.g. "Panic", "Default(default_count)", "Default"
  [[nodiscard]] std::string describe() const;

  friend bool operator==(const ErrorMode & a, const ErrorMode & b)
  {
    return a.kind_ == b.kind_ && a.default_fn_ == b.default_fn_;
  }
  friend bool operator!=(const ErrorMode & a, const ErrorMode & b) { return !(a == b); }

private:
  explicit ErrorMode(Kind kind) noexcept : kind_(kind) {}

  Kind kind_;
  std::optional<std::string> default_fn_;
};

// ============================================================================
// ConversionStrategy
// ============================================================================

enum class StrategyKind : uint8_t {
  Ignore,
  Custom,
  Direct,
  Option,
  Transparent,
  Collection,
};

enum class DirectVariant : uint8_t {
  Assignment,
  WithConversion,
};

enum class OptionVariant : uint8_t {
  Wrap,
  Unwrap,
  Map,
};

enum class CollectionVariant : uint8_t {
  Collect,
  MapOption,
  DirectAssignment,
};

[[nodiscard]] std::string_view to_string(StrategyKind kind) noexcept;

/**
 * The single bidirectional conversion method chosen for a field.
 *
 * Built only through the static factories and immutable afterwards. The
 * error mode is meaningful for Option.Unwrap, Transparent, Custom,
 * Collection.Collect and Ignore (Default only); other strategies carry
 * ErrorMode::none().
 */
class ConversionStrategy
{
public:
  /// An ignored field may still name a default used when reading from the wire.
  [[nodiscard]] static ConversionStrategy ignore(ErrorMode mode = ErrorMode::none());
  /// The error mode applies when the wire value read by from_wire_fn is absent.
  [[nodiscard]] static ConversionStrategy custom(
    std::optional<std::string> from_wire_fn, std::optional<std::string> to_wire_fn,
    ErrorMode mode = ErrorMode::none());
  [[nodiscard]] static ConversionStrategy direct(DirectVariant variant);
  [[nodiscard]] static ConversionStrategy option_wrap();
  [[nodiscard]] static ConversionStrategy option_unwrap(ErrorMode mode);
  [[nodiscard]] static ConversionStrategy option_map();
  [[nodiscard]] static ConversionStrategy transparent(ErrorMode mode);
  [[nodiscard]] static ConversionStrategy collect(ErrorMode mode);
  [[nodiscard]] static ConversionStrategy collection_map_option();
  [[nodiscard]] static ConversionStrategy collection_direct_assignment();

  [[nodiscard]] StrategyKind kind() const noexcept { return kind_; }
  [[nodiscard]] const ErrorMode & error_mode() const noexcept { return error_mode_; }

  /// Only meaningful for the matching kind.
  [[nodiscard]] DirectVariant direct_variant() const noexcept { return direct_; }
  [[nodiscard]] OptionVariant option_variant() const noexcept { return option_; }
  [[nodiscard]] CollectionVariant collection_variant() const noexcept { return collection_; }

  [[nodiscard]] const std::optional<std::string> & custom_from_wire_fn() const noexcept
  {
    return from_wire_fn_;
  }
  [[nodiscard]] const std::optional<std::string> & custom_to_wire_fn() const noexcept
  {
    return to_wire_fn_;
  }

  [[nodiscard]] bool is(StrategyKind kind) const noexcept { return kind_ == kind; }
  [[nodiscard]] bool is(OptionVariant v) const noexcept
  {
    return kind_ == StrategyKind::Option && option_ == v;
  }
  [[nodiscard]] bool is(CollectionVariant v) const noexcept
  {
    return kind_ == StrategyKind::Collection && collection_ == v;
  }
  [[nodiscard]] bool is(DirectVariant v) const noexcept
  {
    return kind_ == StrategyKind::Direct && direct_ == v;
  }

  /// True if the wire->domain conversion can return a typed error.
  [[nodiscard]] bool is_error_moded() const noexcept
  {
    return error_mode_.kind() == ErrorMode::Kind::Error;
  }

  /**
   * Stable textual form used in plans, comments and tests, e.g.
   * "Option.Unwrap(Default(default_count))", "Collection.Collect(Error)",
   * "Custom(from=parse_date, to=-)", "Custom(from=parse, to=-, Error)".
   */
  [[nodiscard]] std::string describe() const;

  friend bool operator==(const ConversionStrategy & a, const ConversionStrategy & b);
  friend bool operator!=(const ConversionStrategy & a, const ConversionStrategy & b)
  {
    return !(a == b);
  }

private:
  explicit ConversionStrategy(StrategyKind kind) : kind_(kind) {}

  StrategyKind kind_;
  DirectVariant direct_ = DirectVariant::Assignment;
  OptionVariant option_ = OptionVariant::Wrap;
  CollectionVariant collection_ = CollectionVariant::Collect;
  ErrorMode error_mode_ = ErrorMode::none();
  std::optional<std::string> from_wire_fn_;
  std::optional<std::string> to_wire_fn_;
};

}  // namespace wirebind
