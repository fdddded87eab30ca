// wirebind/strategy/conversion_plan.hpp - Per-field and per-aggregate plans
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "wirebind/analysis/directive.hpp"
#include "wirebind/analysis/field_shape.hpp"
#include "wirebind/analysis/wire_shape.hpp"
#include "wirebind/schema/schema_document.hpp"
#include "wirebind/strategy/conversion_strategy.hpp"

namespace wirebind
{

/**
 * Everything decided about one field.
 */
struct FieldPlan
{
  FieldDescriptor descriptor;
  FieldAnnotation annotation;
  DomainFieldShape domain_shape;
  WireFieldShape wire_shape;
  InferenceTier tier;

  /// Wire field name after `rename`
  std::string wire_field_name;

  ConversionStrategy strategy;

  [[nodiscard]] const std::string & name() const noexcept { return descriptor.name; }
};

/**
 * Conversion plan of one aggregate, fields in declaration order.
 */
struct StructConversionPlan
{
  std::string aggregate;
  std::string wire_name;

  /// Namespace the conversion functions are emitted into
  std::string domain_namespace;

  std::vector<FieldPlan> fields;

  /// Wire->domain conversion returns a result instead of a value
  bool needs_fallible_conversion = false;

  /// Name of the error struct emitted alongside the conversions, if any
  std::optional<std::string> generated_error_type_name;

  /// Error type of the fallible conversion (generated or user supplied)
  std::optional<std::string> error_type;

  [[nodiscard]] const ConversionStrategy * strategy_for(const std::string & field) const
  {
    for (const auto & f : fields) {
      if (f.name() == field) {
        return &f.strategy;
      }
    }
    return nullptr;
  }
};

}  // namespace wirebind
