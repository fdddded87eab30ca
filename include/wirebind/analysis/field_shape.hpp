// wirebind/analysis/field_shape.hpp - Domain field shape classification
//
// Classifies the declared C++ type text of a domain field into one of a
// fixed set of shapes. Classification is purely syntactic.
//
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "wirebind/analysis/type_registry.hpp"

namespace wirebind
{

enum class DomainShapeKind : uint8_t {
  Primitive,
  NullableWrapper,
  SequenceWrapper,
  TransparentWrapper,
  TaggedEnum,
  CustomAggregate,
};

[[nodiscard]] std::string_view to_string(DomainShapeKind kind) noexcept;

/**
 * Shape of a domain field type.
 *
 * Wrapper shapes own the shape of their inner type. Shapes are immutable
 * once built; the inner pointer is shared, never modified.
 */
class DomainFieldShape
{
public:
  /// Normalised type text, e.g. "std::optional<std::vector<std::string>>"
  [[nodiscard]] const std::string & type_text() const noexcept { return type_text_; }

  [[nodiscard]] DomainShapeKind kind() const noexcept { return kind_; }

  /// Inner shape of NullableWrapper / SequenceWrapper / TransparentWrapper, else nullptr
  [[nodiscard]] const DomainFieldShape * inner() const noexcept { return inner_.get(); }

  /// True for a single identifier without namespace or template arguments.
  [[nodiscard]] bool is_unqualified_name() const noexcept { return unqualified_; }

  [[nodiscard]] bool is_nullable() const noexcept { return kind_ == DomainShapeKind::NullableWrapper; }
  [[nodiscard]] bool is_sequence() const noexcept { return kind_ == DomainShapeKind::SequenceWrapper; }

  /// NullableWrapper(SequenceWrapper(_))
  [[nodiscard]] bool is_nullable_sequence() const noexcept;

  /// The shape with one NullableWrapper layer removed.
  [[nodiscard]] const DomainFieldShape & value_shape() const noexcept;

  /// Element shape of a (possibly nullable) sequence, else the value shape.
  [[nodiscard]] const DomainFieldShape & element_shape() const noexcept;

  /// Structural description, e.g. "NullableWrapper(Primitive)".
  [[nodiscard]] std::string describe() const;

  friend bool operator==(const DomainFieldShape & a, const DomainFieldShape & b);
  friend bool operator!=(const DomainFieldShape & a, const DomainFieldShape & b) { return !(a == b); }

  static DomainFieldShape leaf(DomainShapeKind kind, std::string type_text, bool unqualified = false);
  static DomainFieldShape wrapper(
    DomainShapeKind kind, std::string type_text, DomainFieldShape inner);

private:
  DomainShapeKind kind_ = DomainShapeKind::CustomAggregate;
  std::string type_text_;
  std::shared_ptr<const DomainFieldShape> inner_;
  bool unqualified_ = false;
};

/**
 * Remove redundant whitespace from C++ type text ("std::vector< int32_t >"
 * becomes "std::vector<int32_t>").
 */
[[nodiscard]] std::string normalize_type_text(std::string_view text);

/**
 * Classify declared type text. Total: every input yields a shape.
 *
 * Known wrapper templates are stripped first; then the primitive table, the
 * enum table and the transparent table are consulted. Anything else is a
 * CustomAggregate.
 */
[[nodiscard]] DomainFieldShape classify_field_type(
  std::string_view type_text, const TypeRegistry & registry);

}  // namespace wirebind
